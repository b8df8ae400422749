// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/TaskScheduler.hpp>
#include <core/Uuid.hpp>
#include <onyx/Shortcuts.hpp>
#include <onyx/WebView.hpp>

#include <chrono>
#include <deque>
#include <filesystem>
#include <format>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace onyx::test
{

/// @brief Removes a unique scratch directory on destruction.
class TempDir
{
  public:
    TempDir(): _path(std::filesystem::temp_directory_path() / std::format("onyx-test-{}", generateUuid())) {}

    ~TempDir()
    {
        auto ec = std::error_code {};
        std::filesystem::remove_all(_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return _path; }

  private:
    std::filesystem::path _path;
};

/// @brief Records every script it is asked to evaluate.
class MockWebView: public WebView
{
  public:
    explicit MockWebView(WindowOptions options): options(std::move(options)) {}

    WindowOptions options;
    std::vector<std::string> scripts;
    bool open = true;
    bool focused = false;
    int dragCount = 0;

    [[nodiscard]] auto label() const -> std::string override { return options.label; }

    [[nodiscard]] auto evaluateScript(std::string_view script) -> VoidResult override
    {
        if (!open)
            return makeError(ErrorCode::ScriptError, "closed");
        scripts.emplace_back(script);
        return {};
    }

    [[nodiscard]] auto isOpen() const -> bool override { return open; }

    [[nodiscard]] auto startDragging() -> VoidResult override
    {
        if (!open)
            return makeError(ErrorCode::WindowNotFound, "closed");
        ++dragCount;
        return {};
    }

    void setFocus() override { focused = true; }

    [[nodiscard]] auto nativeHandle() const -> void* override { return nullptr; }
};

/// @brief Creates MockWebViews and lets tests close them.
class MockWindowBackend: public WindowBackend
{
  public:
    std::map<std::string, std::shared_ptr<MockWebView>> created;
    WindowClosedHandler closedHandler;
    CommandHandler commandHandler;
    bool failCreation = false;
    int runCount = 0;

    [[nodiscard]] auto createWindow(const WindowOptions& options) -> Result<std::shared_ptr<WebView>> override
    {
        if (failCreation)
            return makeError(ErrorCode::WindowCreationError, "mock creation failure");
        auto view = std::make_shared<MockWebView>(options);
        created[options.label] = view;
        return view;
    }

    void setClosedHandler(WindowClosedHandler handler) override { closedHandler = std::move(handler); }
    void setCommandHandler(CommandHandler handler) override { commandHandler = std::move(handler); }
    void run() override { ++runCount; }
    void quit() override {}

    /// @brief Simulates the user closing a window.
    void close(const std::string& label)
    {
        created.at(label)->open = false;
        if (closedHandler)
            closedHandler(label);
    }
};

/// @brief Records effect requests instead of touching the desktop.
class MockPlatformEffects: public PlatformEffects
{
  public:
    std::vector<std::string> translucent;
    std::vector<std::filesystem::path> editorOpened;
    std::vector<std::filesystem::path> folderOpened;
    bool failTranslucency = false;

    [[nodiscard]] auto applyTranslucency(const std::shared_ptr<WebView>& window) -> VoidResult override
    {
        if (failTranslucency)
            return makeError(ErrorCode::Unknown, "no compositor");
        translucent.push_back(window->label());
        return {};
    }

    [[nodiscard]] auto openInEditor(const std::filesystem::path& path) -> VoidResult override
    {
        editorOpened.push_back(path);
        return {};
    }

    [[nodiscard]] auto openInFileManager(const std::filesystem::path& path) -> VoidResult override
    {
        folderOpened.push_back(path);
        return {};
    }
};

/// @brief Scheduler that only runs tasks when the test says so.
class ManualScheduler: public TaskScheduler
{
  public:
    struct Entry
    {
        std::chrono::milliseconds delay;
        Task task;
    };

    std::deque<Entry> pending;
    std::vector<std::chrono::milliseconds> delays;

    void schedule(std::chrono::milliseconds delay, Task task) override
    {
        delays.push_back(delay);
        pending.push_back(Entry { .delay = delay, .task = std::move(task) });
    }

    /// @brief Runs the oldest pending task.
    /// @return false if nothing was pending.
    auto runNext() -> bool
    {
        if (pending.empty())
            return false;
        auto entry = std::move(pending.front());
        pending.pop_front();
        entry.task();
        return true;
    }

    /// @brief Runs tasks, including ones they schedule, until none are left.
    auto runAll() -> int
    {
        auto count = 0;
        while (runNext())
            ++count;
        return count;
    }
};

/// @brief Keeps registered callbacks so tests can "press" chords.
class MockShortcutBackend: public GlobalShortcutBackend
{
  public:
    std::vector<std::pair<Chord, std::function<void()>>> registered;
    std::vector<std::string> rejectedChords;
    int unregisterCount = 0;

    [[nodiscard]] auto registerShortcut(const Chord& chord, std::function<void()> callback) -> VoidResult override
    {
        for (auto const& rejected: rejectedChords)
            if (chord.toString() == rejected)
                return makeError(ErrorCode::ShortcutRegistrationError, "already grabbed");
        registered.emplace_back(chord, std::move(callback));
        return {};
    }

    void unregisterAll() override
    {
        ++unregisterCount;
        registered.clear();
    }

    /// @brief Fires the callback bound to a chord.
    /// @return false if the chord is not registered.
    auto press(const std::string& chord) -> bool
    {
        for (auto& [registeredChord, callback]: registered)
        {
            if (registeredChord.toString() == chord)
            {
                callback();
                return true;
            }
        }
        return false;
    }
};

} // namespace onyx::test

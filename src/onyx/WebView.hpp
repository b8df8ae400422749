// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace onyx
{

/// @brief Label of the window created at startup.
constexpr auto MainWindowLabel = std::string_view { "main" };

/// @brief Parameters for creating a web-view window.
struct WindowOptions
{
    std::string label;
    std::string url;
    std::string title;
    int width = 1200;
    int height = 800;
    int minWidth = 800;
    int minHeight = 600;

    /// @brief Request a transparent background so translucency can show through.
    bool transparent = true;

    /// @brief Hide the native title bar so the injected chrome can replace it.
    bool hiddenTitleBar = true;

    /// @brief Script installed to run at document start on every page load.
    std::string initScript;
};

/// @brief One live rendering surface.
///
/// Script evaluation is one-way: success means the script was handed to the
/// rendering engine, nothing is reported back about what it did.
class WebView
{
  public:
    virtual ~WebView() = default;

    [[nodiscard]] virtual auto label() const -> std::string = 0;

    /// @brief Evaluates a script in the currently loaded page.
    /// @return Success, or an error if the window is closed or the engine rejected the call.
    [[nodiscard]] virtual auto evaluateScript(std::string_view script) -> VoidResult = 0;

    /// @brief Returns false once the user (or the platform) destroyed the window.
    [[nodiscard]] virtual auto isOpen() const -> bool = 0;

    /// @brief Starts an interactive window move driven by the pointer.
    [[nodiscard]] virtual auto startDragging() -> VoidResult = 0;

    /// @brief Raises the window and gives it keyboard focus.
    virtual void setFocus() = 0;

    /// @brief Returns the toolkit's native window object (for platform effects).
    [[nodiscard]] virtual auto nativeHandle() const -> void* = 0;
};

/// @brief Called with the label of a window that has been destroyed.
using WindowClosedHandler = std::function<void(const std::string& label)>;

/// @brief Called with the raw text of a front-end message and the label of the sending window.
/// @return The reply (JSON text) to hand back to the page.
using CommandHandler = std::function<std::string(const std::string& label, std::string_view message)>;

/// @brief Creates web-view windows and runs the toolkit's event loop.
class WindowBackend
{
  public:
    virtual ~WindowBackend() = default;

    /// @brief Creates and shows a window. May be called from any thread.
    /// @return The new window or a WindowCreationError.
    [[nodiscard]] virtual auto createWindow(const WindowOptions& options) -> Result<std::shared_ptr<WebView>> = 0;

    virtual void setClosedHandler(WindowClosedHandler handler) = 0;
    virtual void setCommandHandler(CommandHandler handler) = 0;

    /// @brief Runs the event loop until quit() is called or the last window closes.
    virtual void run() = 0;

    virtual void quit() = 0;
};

/// @brief Best-effort, platform-specific side effects.
class PlatformEffects
{
  public:
    virtual ~PlatformEffects() = default;

    /// @brief Makes the window background translucent. Failure is not fatal.
    ///
    /// Implementations may finish the work asynchronously and keep the window alive until then.
    [[nodiscard]] virtual auto applyTranslucency(const std::shared_ptr<WebView>& window) -> VoidResult = 0;

    /// @brief Opens a file in the user's text editor.
    [[nodiscard]] virtual auto openInEditor(const std::filesystem::path& path) -> VoidResult = 0;

    /// @brief Opens a directory in the file manager.
    [[nodiscard]] virtual auto openInFileManager(const std::filesystem::path& path) -> VoidResult = 0;
};

} // namespace onyx

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/TaskScheduler.hpp>
#include <onyx/WebView.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace onyx
{

/// @brief Retry schedule for chrome injection.
///
/// Attempt i (0-based) runs `firstDelay + i * delayStep` after the previous
/// one, so the defaults wait 1s, 2s, 3s, 4s and 5s.
struct ChromeInjectionPolicy
{
    int attempts = 5;
    std::chrono::milliseconds firstDelay { 1000 };
    std::chrono::milliseconds delayStep { 1000 };

    [[nodiscard]] auto delayFor(int attempt) const -> std::chrono::milliseconds
    {
        return firstDelay + delayStep * attempt;
    }
};

/// @brief Creates, configures and tracks web-view windows.
///
/// Thread-safe: windows may be created and looked up from the GUI thread,
/// the shortcut thread and scheduler tasks. The controller must outlive every
/// task it hands to the scheduler.
class WindowController
{
  public:
    WindowController(WindowBackend& backend,
                     PlatformEffects& effects,
                     TaskScheduler& scheduler,
                     ChromeInjectionPolicy policy = {});

    WindowController(const WindowController&) = delete;
    WindowController& operator=(const WindowController&) = delete;

    /// @brief Creates a window with a hidden native title bar and best-effort translucency.
    /// @param url The page to load.
    /// @param title The window title.
    /// @param label The window label; a fresh `onyx-<uuid>` label is generated when empty.
    /// @return The window, or a WindowCreationError (nothing is registered in that case).
    [[nodiscard]] auto createWindow(std::string_view url, std::string_view title, std::string label = {})
        -> Result<std::shared_ptr<WebView>>;

    /// @brief Re-evaluates the chrome script on the retry schedule.
    ///
    /// Each attempt is independent and its failure is ignored. Attempts stop
    /// early once the window is gone.
    void injectChrome(const std::shared_ptr<WebView>& window, std::string script);

    /// @brief Creates a secondary window and starts chrome injection on it.
    [[nodiscard]] auto openWindow(std::string_view url, std::string_view title) -> Result<std::shared_ptr<WebView>>;

    /// @brief Creates the main window at the URL, injects chrome and focuses it.
    [[nodiscard]] auto startMainWindow(std::string_view url, std::string_view title)
        -> Result<std::shared_ptr<WebView>>;

    [[nodiscard]] auto navigate(WebView& window, std::string_view url) -> VoidResult;
    [[nodiscard]] auto reload(WebView& window) -> VoidResult;
    [[nodiscard]] auto goBack(WebView& window) -> VoidResult;
    [[nodiscard]] auto goForward(WebView& window) -> VoidResult;

    /// @brief Looks up a live window by label.
    [[nodiscard]] auto window(std::string_view label) const -> std::shared_ptr<WebView>;

    /// @brief Returns the main window, or nullptr once it has been closed.
    [[nodiscard]] auto mainWindow() const -> std::shared_ptr<WebView>;

    /// @brief Returns the labels of all live windows.
    [[nodiscard]] auto labels() const -> std::vector<std::string>;

    /// @brief Forgets a window that the platform destroyed.
    void windowClosed(const std::string& label);

  private:
    void scheduleInjection(std::weak_ptr<WebView> window, std::shared_ptr<const std::string> script, int attempt);

    WindowBackend& _backend;
    PlatformEffects& _effects;
    TaskScheduler& _scheduler;
    ChromeInjectionPolicy _policy;

    mutable std::mutex _mutex;
    std::map<std::string, std::shared_ptr<WebView>, std::less<>> _windows;
};

} // namespace onyx

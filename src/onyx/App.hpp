// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <onyx/Config.hpp>
#include <onyx/Shortcuts.hpp>
#include <onyx/WebView.hpp>

#include <memory>

namespace onyx
{

/// @brief Application orchestrator that wires configuration, windows and shortcuts together.
class App
{
  public:
    /// @brief Constructs the application and loads the configuration from the store.
    /// @param store Where the configuration lives.
    /// @param windows The toolkit's window backend.
    /// @param effects Platform effects for translucency and opening files.
    /// @param shortcuts Global shortcut backend, or nullptr to run without global shortcuts.
    App(ConfigStore store,
        std::unique_ptr<WindowBackend> windows,
        std::unique_ptr<PlatformEffects> effects,
        std::unique_ptr<GlobalShortcutBackend> shortcuts);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Opens the main window and registers the global shortcuts.
    /// @return Success or the error that kept the main window from opening.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the event loop until the last window closes.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace onyx

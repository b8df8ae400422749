// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <onyx/ConfigState.hpp>
#include <onyx/WebView.hpp>
#include <onyx/WindowController.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace onyx
{

/// @brief Operations the rendered front end can invoke.
///
/// Every operation is individually atomic: it takes the config lock only for
/// the duration of its own read or update and never across window work.
class CommandSurface
{
  public:
    CommandSurface(ConfigState& config, WindowController& windows, PlatformEffects& effects);

    [[nodiscard]] auto getServerUrl() const -> std::string;

    /// @brief Validates, normalizes and persists a new server URL.
    /// @return The stored (normalized) URL.
    [[nodiscard]] auto setServerUrl(std::string_view url) -> Result<std::string>;

    [[nodiscard]] auto getConfigPath() const -> Result<std::string>;

    /// @brief Opens the config file in the user's editor, creating it first if missing.
    [[nodiscard]] auto openConfigFile() -> VoidResult;

    /// @brief Opens the config directory in the file manager, creating it first if missing.
    [[nodiscard]] auto openConfigDirectory() -> VoidResult;

    /// @brief Points the window at `<server_url><path>`.
    void navigateTo(WebView& window, std::string_view path);

    void reloadPage(WebView& window);
    void goBack(WebView& window);
    void goForward(WebView& window);

    /// @brief Opens a secondary window at the configured server URL.
    [[nodiscard]] auto newWindow() -> VoidResult;

    [[nodiscard]] auto resetConfig() -> VoidResult;

    [[nodiscard]] auto startDragWindow(WebView& window) -> VoidResult;

    /// @brief Dispatches a command by name.
    /// @param command The command name, e.g. `set_server_url`.
    /// @param args The command arguments (a JSON object, may be empty).
    /// @param originLabel Label of the window that issued the command.
    /// @return The command's JSON result (null for commands without one) or an error.
    [[nodiscard]] auto invoke(std::string_view command, const nlohmann::json& args, const std::string& originLabel)
        -> Result<nlohmann::json>;

  private:
    ConfigState& _config;
    WindowController& _windows;
    PlatformEffects& _effects;
};

} // namespace onyx

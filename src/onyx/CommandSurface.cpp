// SPDX-License-Identifier: Apache-2.0
#include "CommandSurface.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace onyx
{

namespace
{

    /// @brief Logs the failure of a fire-and-forget script evaluation.
    void ignoreScriptResult(const VoidResult& result, std::string_view what)
    {
        if (!result)
            log::trace("{} failed: {}", what, result.error().message);
    }

} // namespace

CommandSurface::CommandSurface(ConfigState& config, WindowController& windows, PlatformEffects& effects):
    _config(config), _windows(windows), _effects(effects)
{
}

auto CommandSurface::getServerUrl() const -> std::string
{
    return _config.read().serverUrl;
}

auto CommandSurface::setServerUrl(std::string_view url) -> Result<std::string>
{
    return _config.setServerUrl(url);
}

auto CommandSurface::getConfigPath() const -> Result<std::string>
{
    return _config.store().configPath().transform([](const std::filesystem::path& p) { return p.string(); });
}

auto CommandSurface::openConfigFile() -> VoidResult
{
    auto path = _config.ensurePersisted();
    if (!path)
        return std::unexpected(path.error());

    return _effects.openInEditor(*path);
}

auto CommandSurface::openConfigDirectory() -> VoidResult
{
    auto dir = _config.store().ensureDirectory();
    if (!dir)
        return std::unexpected(dir.error());

    return _effects.openInFileManager(*dir);
}

void CommandSurface::navigateTo(WebView& window, std::string_view path)
{
    auto const url = std::format("{}{}", getServerUrl(), path);
    ignoreScriptResult(_windows.navigate(window, url), "Navigation");
}

void CommandSurface::reloadPage(WebView& window)
{
    ignoreScriptResult(_windows.reload(window), "Reload");
}

void CommandSurface::goBack(WebView& window)
{
    ignoreScriptResult(_windows.goBack(window), "History back");
}

void CommandSurface::goForward(WebView& window)
{
    ignoreScriptResult(_windows.goForward(window), "History forward");
}

auto CommandSurface::newWindow() -> VoidResult
{
    auto const config = _config.read();
    auto window = _windows.openWindow(config.serverUrl, config.windowTitle);
    if (!window)
        return std::unexpected(window.error());
    return {};
}

auto CommandSurface::resetConfig() -> VoidResult
{
    return _config.reset();
}

auto CommandSurface::startDragWindow(WebView& window) -> VoidResult
{
    return window.startDragging();
}

auto CommandSurface::invoke(std::string_view command, const nlohmann::json& args, const std::string& originLabel)
    -> Result<nlohmann::json>
{
    auto toJson = [](const VoidResult& result) -> Result<nlohmann::json> {
        if (!result)
            return std::unexpected(result.error());
        return nlohmann::json(nullptr);
    };

    auto originWindow = [&]() -> Result<std::shared_ptr<WebView>> {
        auto window = _windows.window(originLabel);
        if (!window)
            return makeError(ErrorCode::WindowNotFound, std::format("No open window '{}'", originLabel));
        return window;
    };

    log::debug("Command '{}' from '{}'", command, originLabel);

    if (command == "get_server_url")
        return nlohmann::json(getServerUrl());

    if (command == "set_server_url")
    {
        auto url = json::getString(args, "url");
        if (!url)
            return std::unexpected(url.error());
        return setServerUrl(*url).transform([](std::string stored) { return nlohmann::json(std::move(stored)); });
    }

    if (command == "get_config_path")
        return getConfigPath().transform([](std::string path) { return nlohmann::json(std::move(path)); });

    if (command == "open_config_file")
        return toJson(openConfigFile());

    if (command == "open_config_directory")
        return toJson(openConfigDirectory());

    if (command == "new_window")
        return toJson(newWindow());

    if (command == "reset_config")
        return toJson(resetConfig());

    if (command == "navigate_to" || command == "reload_page" || command == "go_back" || command == "go_forward"
        || command == "start_drag_window")
    {
        auto window = originWindow();
        if (!window)
            return std::unexpected(window.error());

        if (command == "navigate_to")
        {
            auto path = json::getString(args, "path");
            if (!path)
                return std::unexpected(path.error());
            navigateTo(**window, *path);
        }
        else if (command == "reload_page")
            reloadPage(**window);
        else if (command == "go_back")
            goBack(**window);
        else if (command == "go_forward")
            goForward(**window);
        else
            return toJson(startDragWindow(**window));

        return nlohmann::json(nullptr);
    }

    return makeError(ErrorCode::InvalidArgument, std::format("Unknown command: {}", command));
}

} // namespace onyx

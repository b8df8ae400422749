// SPDX-License-Identifier: Apache-2.0
#include "Shortcuts.hpp"

#include <core/Log.hpp>
#include <onyx/CommandSurface.hpp>
#include <onyx/ConfigState.hpp>
#include <onyx/WindowController.hpp>

#include <algorithm>
#include <cctype>
#include <format>

namespace onyx
{

namespace
{

    auto toLower(std::string_view text) -> std::string
    {
        auto result = std::string(text);
        std::ranges::transform(
            result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    auto modifierFromName(std::string_view name) -> std::optional<KeyMod>
    {
        auto const lower = toLower(name);
        if (lower == "super" || lower == "meta" || lower == "win" || lower == "cmd" || lower == "command")
            return KeyMod::Super;
        if (lower == "ctrl" || lower == "control")
            return KeyMod::Control;
        if (lower == "alt" || lower == "option")
            return KeyMod::Alt;
        if (lower == "shift")
            return KeyMod::Shift;
        return std::nullopt;
    }

} // namespace

auto Chord::toString() const -> std::string
{
    auto result = std::string {};
    if (hasMod(mods, KeyMod::Super))
        result += "Super+";
    if (hasMod(mods, KeyMod::Control))
        result += "Ctrl+";
    if (hasMod(mods, KeyMod::Alt))
        result += "Alt+";
    if (hasMod(mods, KeyMod::Shift))
        result += "Shift+";
    result += key;
    return result;
}

auto Chord::fromString(std::string_view text) -> std::optional<Chord>
{
    if (text.empty())
        return std::nullopt;

    auto chord = Chord {};
    auto start = std::size_t { 0 };
    while (true)
    {
        auto const plus = text.find('+', start);
        // The last segment is the key. A trailing "++" means the key itself is '+'.
        if (plus == std::string_view::npos || (plus == start && plus + 1 == text.size()))
        {
            auto const key = text.substr(start);
            if (key.empty())
                return std::nullopt;
            if (key.size() == 1)
                chord.key = std::string(1, static_cast<char>(std::toupper(static_cast<unsigned char>(key[0]))));
            else
                chord.key = std::string(key);
            return chord;
        }

        auto const mod = modifierFromName(text.substr(start, plus - start));
        if (!mod)
            return std::nullopt;
        chord.mods = chord.mods | *mod;
        start = plus + 1;
    }
}

auto actionName(ShortcutAction action) -> std::string_view
{
    switch (action)
    {
        case ShortcutAction::NewChat: return "new-chat";
        case ShortcutAction::Reload: return "reload";
        case ShortcutAction::Back: return "back";
        case ShortcutAction::Forward: return "forward";
        case ShortcutAction::NewWindow: return "new-window";
        case ShortcutAction::OpenSettings: return "open-settings";
    }
    return "unknown";
}

auto defaultBindings() -> std::vector<ShortcutBinding>
{
    return {
        { .chord = { .mods = KeyMod::Super, .key = "N" }, .action = ShortcutAction::NewChat },
        { .chord = { .mods = KeyMod::Super, .key = "R" }, .action = ShortcutAction::Reload },
        { .chord = { .mods = KeyMod::Super, .key = "[" }, .action = ShortcutAction::Back },
        { .chord = { .mods = KeyMod::Super, .key = "]" }, .action = ShortcutAction::Forward },
        { .chord = { .mods = KeyMod::Super | KeyMod::Shift, .key = "N" }, .action = ShortcutAction::NewWindow },
        { .chord = { .mods = KeyMod::Super, .key = "," }, .action = ShortcutAction::OpenSettings },
    };
}

ShortcutRouter::ShortcutRouter(ConfigState& config,
                               WindowController& windows,
                               CommandSurface& commands,
                               TaskScheduler& scheduler):
    _config(config), _windows(windows), _commands(commands), _scheduler(scheduler)
{
}

auto ShortcutRouter::registerAll(GlobalShortcutBackend& backend, std::vector<ShortcutBinding> bindings) -> std::size_t
{
    _bindings.clear();
    for (auto& binding: bindings)
    {
        auto const action = binding.action;
        auto result = backend.registerShortcut(binding.chord, [this, action] { dispatch(action); });
        if (!result)
        {
            log::warning("Failed to register shortcut {} ({}): {}",
                         binding.chord.toString(),
                         actionName(action),
                         result.error().message);
            continue;
        }

        log::debug("Registered shortcut {} -> {}", binding.chord.toString(), actionName(action));
        _bindings.push_back(std::move(binding));
    }
    return _bindings.size();
}

void ShortcutRouter::dispatch(ShortcutAction action)
{
    log::debug("Shortcut triggered: {}", actionName(action));

    if (action == ShortcutAction::NewWindow)
    {
        auto config = _config.read();
        _scheduler.post([this, config = std::move(config)] {
            if (auto window = _windows.openWindow(config.serverUrl, config.windowTitle); !window)
                log::error("Failed to open new window: {}", window.error().message);
        });
        return;
    }

    auto mainWindow = _windows.mainWindow();
    if (!mainWindow)
    {
        log::debug("No main window, ignoring {}", actionName(action));
        return;
    }

    switch (action)
    {
        case ShortcutAction::NewChat: _commands.navigateTo(*mainWindow, NewChatPath); break;
        case ShortcutAction::Reload: _commands.reloadPage(*mainWindow); break;
        case ShortcutAction::Back: _commands.goBack(*mainWindow); break;
        case ShortcutAction::Forward: _commands.goForward(*mainWindow); break;
        case ShortcutAction::OpenSettings:
            if (auto opened = _commands.openConfigFile(); !opened)
                log::warning("Failed to open config file: {}", opened.error().message);
            break;
        case ShortcutAction::NewWindow: break;
    }
}

} // namespace onyx

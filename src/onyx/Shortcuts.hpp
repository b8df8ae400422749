// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/TaskScheduler.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace onyx
{

class CommandSurface;
class ConfigState;
class WindowController;

/// @brief Modifier flags of a shortcut chord.
enum class KeyMod : std::uint8_t
{
    None = 0,
    Shift = 0x01,
    Control = 0x02,
    Alt = 0x04,
    Super = 0x08,
};

constexpr auto operator|(KeyMod a, KeyMod b) -> KeyMod
{
    return static_cast<KeyMod>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}

constexpr auto hasMod(KeyMod mods, KeyMod flag) -> bool
{
    return (static_cast<std::uint8_t>(mods) & static_cast<std::uint8_t>(flag)) != 0;
}

/// @brief A key plus modifiers, e.g. "Super+Shift+N".
struct Chord
{
    KeyMod mods = KeyMod::None;

    /// @brief Key name: a single character ("N", "[", ",") or a named key ("F5").
    std::string key;

    /// @brief Formats the chord as "Super+Ctrl+Alt+Shift+Key".
    [[nodiscard]] auto toString() const -> std::string;

    /// @brief Parses "Super+Shift+N" style text. Modifier names are case-insensitive.
    [[nodiscard]] static auto fromString(std::string_view text) -> std::optional<Chord>;

    auto operator==(const Chord&) const -> bool = default;
};

/// @brief Semantic actions reachable through global shortcuts.
enum class ShortcutAction : std::uint8_t
{
    NewChat,
    Reload,
    Back,
    Forward,
    NewWindow,
    OpenSettings,
};

[[nodiscard]] auto actionName(ShortcutAction action) -> std::string_view;

struct ShortcutBinding
{
    Chord chord;
    ShortcutAction action;
};

/// @brief Path (relative to the server URL) opened by the new-chat shortcut.
constexpr auto NewChatPath = std::string_view { "/chat" };

/// @brief Returns the fixed set of bindings registered at startup.
[[nodiscard]] auto defaultBindings() -> std::vector<ShortcutBinding>;

/// @brief OS-level global hotkey registration.
class GlobalShortcutBackend
{
  public:
    virtual ~GlobalShortcutBackend() = default;

    /// @brief Grabs a chord system-wide. The callback runs on the backend's event thread.
    /// @return Success or a ShortcutRegistrationError.
    [[nodiscard]] virtual auto registerShortcut(const Chord& chord, std::function<void()> callback) -> VoidResult = 0;

    virtual void unregisterAll() = 0;
};

/// @brief Binds chords to actions and dispatches them against the main window.
///
/// Bindings are registered once and never change while the process runs.
class ShortcutRouter
{
  public:
    ShortcutRouter(ConfigState& config, WindowController& windows, CommandSurface& commands, TaskScheduler& scheduler);

    ShortcutRouter(const ShortcutRouter&) = delete;
    ShortcutRouter& operator=(const ShortcutRouter&) = delete;

    /// @brief Registers the bindings. A chord that fails to register is logged and skipped.
    /// @return The number of bindings that were registered.
    auto registerAll(GlobalShortcutBackend& backend, std::vector<ShortcutBinding> bindings = defaultBindings())
        -> std::size_t;

    /// @brief Runs an action.
    ///
    /// Runs on the calling thread, except new-window which is handed to the
    /// scheduler. Without a main window every action but new-window is a no-op.
    void dispatch(ShortcutAction action);

    [[nodiscard]] auto bindings() const -> const std::vector<ShortcutBinding>& { return _bindings; }

  private:
    ConfigState& _config;
    WindowController& _windows;
    CommandSurface& _commands;
    TaskScheduler& _scheduler;
    std::vector<ShortcutBinding> _bindings;
};

} // namespace onyx

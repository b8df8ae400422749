// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <onyx/Shortcuts.hpp>

#include <memory>

namespace onyx::platform
{

/// @brief Global shortcuts through passive key grabs on the X11 root window.
///
/// Uses its own display connection and event thread. Callbacks run on that
/// thread, one at a time.
class X11ShortcutBackend: public GlobalShortcutBackend
{
  public:
    ~X11ShortcutBackend() override;

    X11ShortcutBackend(const X11ShortcutBackend&) = delete;
    X11ShortcutBackend& operator=(const X11ShortcutBackend&) = delete;

    /// @brief Connects to the X server named by $DISPLAY.
    /// @return The backend or a ShortcutRegistrationError when no X server is reachable.
    [[nodiscard]] static auto create() -> Result<std::unique_ptr<X11ShortcutBackend>>;

    [[nodiscard]] auto registerShortcut(const Chord& chord, std::function<void()> callback) -> VoidResult override;

    /// @brief Releases every grab. No callback runs once this returns.
    void unregisterAll() override;

  private:
    struct Impl;

    X11ShortcutBackend();

    std::unique_ptr<Impl> _impl;
};

} // namespace onyx::platform

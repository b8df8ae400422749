// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <X11/Xlib.h>

#include <optional>

namespace onyx::platform
{

/// @brief Looks up an atom without creating it.
/// @return nullopt if no client on the display has interned the name.
[[nodiscard]] auto existingAtom(Display* display, const char* name) -> std::optional<Atom>;

} // namespace onyx::platform

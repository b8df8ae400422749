// SPDX-License-Identifier: Apache-2.0
#include "X11Atoms.hpp"

namespace onyx::platform
{

auto existingAtom(Display* display, const char* name) -> std::optional<Atom>
{
    if (!display || !name)
        return std::nullopt;

    auto const atom = XInternAtom(display, name, True);
    if (atom == None)
        return std::nullopt;
    return atom;
}

} // namespace onyx::platform

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string>
#include <vector>

namespace onyx::process
{

/// @brief Starts a program without waiting for it to finish.
///
/// The program is looked up on PATH. Its exit status is never observed; the
/// child is reaped in the background so it does not linger as a zombie.
/// @param command The program to run.
/// @param args Arguments passed after the program name.
/// @return Success once the process has been started, or a LaunchError.
[[nodiscard]] auto spawnDetached(const std::string& command, const std::vector<std::string>& args)
    -> VoidResult;

} // namespace onyx::process

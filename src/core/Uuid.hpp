// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

namespace onyx
{

/// @brief Generates a random (version 4) UUID in canonical 8-4-4-4-12 form.
[[nodiscard]] auto generateUuid() -> std::string;

} // namespace onyx

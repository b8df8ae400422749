// SPDX-License-Identifier: Apache-2.0
#include "Uuid.hpp"

#include <array>
#include <cstdint>
#include <format>
#include <random>

namespace onyx
{

auto generateUuid() -> std::string
{
    thread_local auto engine = std::mt19937_64 { std::random_device {}() };

    auto bytes = std::array<std::uint8_t, 16> {};
    auto dist = std::uniform_int_distribution<int> { 0, 255 };
    for (auto& b: bytes)
        b = static_cast<std::uint8_t>(dist(engine));

    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

    auto out = std::string {};
    out.reserve(36);
    for (auto i = 0u; i < bytes.size(); ++i)
    {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            out += '-';
        out += std::format("{:02x}", bytes[i]);
    }
    return out;
}

} // namespace onyx

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace onyx
{
class CommandSurface;
}

namespace onyx::bridge
{

/// @brief A command message posted by the page through `window.onyx.invoke()`.
struct Request
{
    nlohmann::json id;
    std::string command;
    nlohmann::json args = nlohmann::json::object();
};

/// @brief Parses a message of the form `{"id": 1, "command": "...", "args": {...}}`.
/// @param text The raw message text.
/// @return The parsed request or an InvalidArgument error.
[[nodiscard]] auto parseRequest(std::string_view text) -> Result<Request>;

/// @brief Builds the reply delivered back to the page.
///
/// Success: `{"id", "ok": true, "result"}`. Failure: `{"id", "ok": false, "error"}`
/// where `error` is the user-visible message.
[[nodiscard]] auto makeReply(const nlohmann::json& id, const Result<nlohmann::json>& result) -> nlohmann::json;

/// @brief Parses a message, runs the command and serializes the reply.
/// @param commands The command surface to dispatch to.
/// @param label Label of the window that posted the message.
/// @param text The raw message text.
/// @return The reply as JSON text.
[[nodiscard]] auto handleMessage(CommandSurface& commands, const std::string& label, std::string_view text)
    -> std::string;

} // namespace onyx::bridge

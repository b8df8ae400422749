// SPDX-License-Identifier: Apache-2.0
#include "CommandBridge.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <onyx/CommandSurface.hpp>

#include <format>

namespace onyx::bridge
{

auto parseRequest(std::string_view text) -> Result<Request>
{
    auto parsed = json::parse(text);
    if (!parsed)
        return std::unexpected(parsed.error());

    auto const& message = *parsed;
    if (!message.is_object())
        return makeError(ErrorCode::InvalidArgument, "Command message must be a JSON object");

    auto command = json::getString(message, "command");
    if (!command)
        return std::unexpected(command.error());

    auto request = Request {
        .id = message.value("id", nlohmann::json(nullptr)),
        .command = std::move(*command),
    };

    if (message.contains("args"))
    {
        auto const& args = message["args"];
        if (!args.is_object() && !args.is_null())
            return makeError(ErrorCode::InvalidArgument, "Command args must be a JSON object");
        if (args.is_object())
            request.args = args;
    }

    return request;
}

auto makeReply(const nlohmann::json& id, const Result<nlohmann::json>& result) -> nlohmann::json
{
    if (!result)
        return nlohmann::json {
            { "id", id },
            { "ok", false },
            { "error", result.error().message },
        };

    return nlohmann::json {
        { "id", id },
        { "ok", true },
        { "result", *result },
    };
}

auto handleMessage(CommandSurface& commands, const std::string& label, std::string_view text) -> std::string
{
    auto request = parseRequest(text);
    if (!request)
    {
        log::warning("Rejected message from '{}': {}", label, request.error().message);
        return makeReply(nullptr, std::unexpected(request.error()))
            .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    auto result = commands.invoke(request->command, request->args, label);
    if (!result)
        log::warning("Command '{}' failed: {}", request->command, result.error());

    return makeReply(request->id, result).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace onyx::bridge

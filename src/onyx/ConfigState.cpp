// SPDX-License-Identifier: Apache-2.0
#include "ConfigState.hpp"

#include <core/Log.hpp>

#include <mutex>

namespace onyx
{

ConfigState::ConfigState(ConfigStore store, AppConfig initial):
    _store(std::move(store)), _config(std::move(initial))
{
}

auto ConfigState::read() const -> AppConfig
{
    auto const lock = std::shared_lock(_mutex);
    return _config;
}

auto ConfigState::update(const Updater& updater) -> Result<AppConfig>
{
    auto const lock = std::unique_lock(_mutex);

    auto next = updater(_config);
    if (!next)
        return std::unexpected(next.error());

    if (auto saved = _store.save(*next); !saved)
    {
        log::error("Failed to save config: {}", saved.error().message);
        return std::unexpected(saved.error());
    }

    _config = std::move(*next);
    return _config;
}

auto ConfigState::setServerUrl(std::string_view url) -> Result<std::string>
{
    auto result = update([url](AppConfig config) -> Result<AppConfig> {
        auto normalized = validateServerUrl(url);
        if (!normalized)
            return std::unexpected(normalized.error());
        config.serverUrl = std::move(*normalized);
        return config;
    });

    if (!result)
        return std::unexpected(result.error());

    log::info("Server URL set to {}", result->serverUrl);
    return result->serverUrl;
}

auto ConfigState::reset() -> VoidResult
{
    auto result = update([](AppConfig) -> Result<AppConfig> { return AppConfig {}; });
    if (!result)
        return std::unexpected(result.error());

    log::info("Config reset to defaults");
    return {};
}

auto ConfigState::ensurePersisted() -> Result<std::filesystem::path>
{
    auto const lock = std::unique_lock(_mutex);

    auto path = _store.configPath();
    if (!path)
        return path;

    auto ec = std::error_code {};
    if (std::filesystem::exists(*path, ec))
        return path;

    if (auto saved = _store.save(_config); !saved)
        return std::unexpected(saved.error());

    log::info("Created config file at {}", path->string());
    return path;
}

} // namespace onyx

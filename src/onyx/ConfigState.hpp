// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <onyx/Config.hpp>

#include <filesystem>
#include <functional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace onyx
{

/// @brief Lock-guarded owner of the current configuration.
///
/// Readers get a copy under a shared lock. Writers hold the exclusive lock
/// while validating, persisting and committing, so concurrent updates are
/// serialized and the in-memory value never diverges from the file after a
/// successful update.
class ConfigState
{
  public:
    /// @brief Produces the next configuration from the current one, or a validation error.
    using Updater = std::function<Result<AppConfig>(AppConfig current)>;

    /// @brief Constructs the state with an already loaded configuration.
    /// @param store The store used to persist updates.
    /// @param initial The configuration loaded at startup.
    ConfigState(ConfigStore store, AppConfig initial);

    ConfigState(const ConfigState&) = delete;
    ConfigState& operator=(const ConfigState&) = delete;

    /// @brief Returns a copy of the current configuration.
    [[nodiscard]] auto read() const -> AppConfig;

    /// @brief Applies an update: validate, persist, then commit.
    ///
    /// On validation or persist failure the previous value stays in place and
    /// the error is returned.
    /// @param updater Computes the new configuration.
    /// @return The committed configuration or an error.
    [[nodiscard]] auto update(const Updater& updater) -> Result<AppConfig>;

    /// @brief Validates, normalizes and stores a new server URL.
    /// @return The normalized URL that was stored.
    [[nodiscard]] auto setServerUrl(std::string_view url) -> Result<std::string>;

    /// @brief Restores and persists the default configuration.
    [[nodiscard]] auto reset() -> VoidResult;

    /// @brief Writes the current configuration if the file does not exist yet.
    /// @return The config file path.
    [[nodiscard]] auto ensurePersisted() -> Result<std::filesystem::path>;

    /// @brief Returns the store backing this state.
    [[nodiscard]] auto store() const noexcept -> const ConfigStore& { return _store; }

  private:
    ConfigStore _store;
    mutable std::shared_mutex _mutex;
    AppConfig _config;
};

} // namespace onyx

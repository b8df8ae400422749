// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace onyx
{

/// @brief Server the shell points at when nothing else is configured.
constexpr auto DefaultServerUrl = std::string_view { "https://cloud.onyx.app" };

/// @brief Window title used when the config file does not name one.
constexpr auto DefaultWindowTitle = std::string_view { "Onyx" };

/// @brief Name of the settings file inside the config directory.
constexpr auto ConfigFileName = std::string_view { "config.json" };

/// @brief Application identifier triple used to derive the platform config directory.
constexpr auto AppQualifier = std::string_view { "app" };
constexpr auto AppOrganization = std::string_view { "onyx" };
constexpr auto AppName = std::string_view { "desktop" };

/// @brief Persisted user settings.
struct AppConfig
{
    /// @brief Absolute http(s) URL without trailing slash.
    std::string serverUrl = std::string(DefaultServerUrl);

    std::string windowTitle = std::string(DefaultWindowTitle);

    auto operator==(const AppConfig&) const -> bool = default;
};

/// @brief Validates and normalizes a server URL.
///
/// The URL must start with `http://` or `https://` and name a host. Trailing
/// slashes are stripped.
/// @param url The user-supplied URL.
/// @return The normalized URL or a ValidationError.
[[nodiscard]] auto validateServerUrl(std::string_view url) -> Result<std::string>;

/// @brief Parses the contents of a config file.
///
/// `server_url` is required and must pass validateServerUrl(), `window_title`
/// is optional. Unknown fields are ignored.
/// @param content The file contents.
/// @return The configuration or a ConfigParseError.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Serializes a configuration as pretty-printed JSON.
[[nodiscard]] auto serializeConfig(const AppConfig& config) -> std::string;

/// @brief Returns the per-user config directory for the current platform.
///
/// On Linux: $XDG_CONFIG_HOME/desktop or ~/.config/desktop
/// On macOS: ~/Library/Application Support/app.onyx.desktop
/// On Windows: %APPDATA%\onyx\desktop\config
/// @return The directory, or std::nullopt if the environment does not allow resolving one.
[[nodiscard]] auto platformConfigDir() -> std::optional<std::filesystem::path>;

/// @brief Loads and saves the configuration file.
///
/// Path resolution happens the same way for load and save, so a save always
/// lands where a later load looks.
class ConfigStore
{
  public:
    /// @brief Creates a store rooted at the platform config directory.
    ConfigStore();

    /// @brief Creates a store rooted at the given directory.
    /// @param directory The config directory, or std::nullopt if none can be resolved.
    explicit ConfigStore(std::optional<std::filesystem::path> directory);

    /// @brief Returns the config directory.
    [[nodiscard]] auto configDir() const -> Result<std::filesystem::path>;

    /// @brief Returns the full path of the config file.
    [[nodiscard]] auto configPath() const -> Result<std::filesystem::path>;

    /// @brief Loads the configuration, never failing.
    ///
    /// Writes defaults if no file exists yet. A file that cannot be read or
    /// parsed is left untouched and defaults are returned.
    [[nodiscard]] auto load() const -> AppConfig;

    /// @brief Reads and parses a specific config file.
    /// @param path The file to read.
    /// @return The configuration or an error.
    [[nodiscard]] static auto loadFromFile(const std::filesystem::path& path) -> Result<AppConfig>;

    /// @brief Writes the configuration, creating the directory if needed.
    ///
    /// The file is replaced atomically: the new contents are written to a
    /// temporary file next to it and renamed over the old one.
    /// @param config The configuration to persist.
    /// @return Success or a ConfigWriteError / ConfigDirectoryUnresolvable.
    [[nodiscard]] auto save(const AppConfig& config) const -> VoidResult;

    /// @brief Creates the config directory if it does not exist.
    /// @return The directory or an error.
    [[nodiscard]] auto ensureDirectory() const -> Result<std::filesystem::path>;

  private:
    std::optional<std::filesystem::path> _directory;
};

} // namespace onyx

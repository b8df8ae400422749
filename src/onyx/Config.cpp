// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Uuid.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace onyx
{

namespace
{

    constexpr auto HttpScheme = std::string_view { "http://" };
    constexpr auto HttpsScheme = std::string_view { "https://" };

    auto envPath(char const* name) -> std::optional<std::filesystem::path>
    {
        auto const* const value = std::getenv(name);
        if (!value || !*value)
            return std::nullopt;
        auto path = std::filesystem::path(value);
        if (!path.is_absolute())
            return std::nullopt;
        return path;
    }

} // namespace

auto validateServerUrl(std::string_view url) -> Result<std::string>
{
    auto schemeLength = std::size_t { 0 };
    if (url.starts_with(HttpsScheme))
        schemeLength = HttpsScheme.size();
    else if (url.starts_with(HttpScheme))
        schemeLength = HttpScheme.size();
    else
        return makeError(ErrorCode::ValidationError, "URL must start with http:// or https://");

    auto normalized = std::string(url);
    while (normalized.size() > schemeLength && normalized.ends_with('/'))
        normalized.pop_back();

    auto const hostEnd = normalized.find_first_of("/?#", schemeLength);
    auto const host = std::string_view(normalized).substr(schemeLength, hostEnd - schemeLength);
    if (host.empty())
        return makeError(ErrorCode::ValidationError, std::format("URL has no host: {}", url));

    if (normalized.find_first_of(" \t\r\n") != std::string::npos)
        return makeError(ErrorCode::ValidationError, "URL must not contain whitespace");

    if (!json::isValidUtf8(normalized))
        return makeError(ErrorCode::ValidationError, "URL is not valid UTF-8");

    return normalized;
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content, ErrorCode::ConfigParseError);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigParseError, "Config root must be a JSON object");

    auto serverUrl = json::getString(root, "server_url", ErrorCode::ConfigParseError);
    if (!serverUrl)
        return std::unexpected(serverUrl.error());

    auto validated = validateServerUrl(*serverUrl);
    if (!validated)
        return makeError(ErrorCode::ConfigParseError,
                         std::format("Invalid server_url: {}", validated.error().message));

    if (root.contains("window_title") && !root["window_title"].is_string())
        return makeError(ErrorCode::ConfigParseError, "window_title must be a string");

    return AppConfig {
        .serverUrl = std::move(*validated),
        .windowTitle = json::getStringOr(root, "window_title", DefaultWindowTitle),
    };
}

auto serializeConfig(const AppConfig& config) -> std::string
{
    auto root = nlohmann::ordered_json::object();
    root["server_url"] = config.serverUrl;
    root["window_title"] = config.windowTitle;
    return root.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace) + '\n';
}

auto platformConfigDir() -> std::optional<std::filesystem::path>
{
#ifdef _WIN32
    if (auto appData = envPath("APPDATA"))
        return *appData / AppOrganization / AppName / "config";
    return std::nullopt;
#elif defined(__APPLE__)
    if (auto home = envPath("HOME"))
        return *home / "Library" / "Application Support"
               / std::format("{}.{}.{}", AppQualifier, AppOrganization, AppName);
    return std::nullopt;
#else
    if (auto xdgConfig = envPath("XDG_CONFIG_HOME"))
        return *xdgConfig / AppName;
    if (auto home = envPath("HOME"))
        return *home / ".config" / AppName;
    return std::nullopt;
#endif
}

ConfigStore::ConfigStore(): ConfigStore(platformConfigDir())
{
}

ConfigStore::ConfigStore(std::optional<std::filesystem::path> directory)
{
    if (directory)
    {
        auto ec = std::error_code {};
        auto absolute = std::filesystem::absolute(*directory, ec);
        _directory = ec ? std::move(*directory) : std::move(absolute);
    }
}

auto ConfigStore::configDir() const -> Result<std::filesystem::path>
{
    if (!_directory)
        return makeError(ErrorCode::ConfigDirectoryUnresolvable, "Could not determine config directory");
    return *_directory;
}

auto ConfigStore::configPath() const -> Result<std::filesystem::path>
{
    return configDir().transform([](const std::filesystem::path& dir) { return dir / ConfigFileName; });
}

auto ConfigStore::loadFromFile(const std::filesystem::path& path) -> Result<AppConfig>
{
    auto file = std::ifstream(path);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open config file: {}", path.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    if (file.bad())
        return makeError(ErrorCode::IoError, std::format("Failed to read config file: {}", path.string()));

    return parseConfig(ss.str());
}

auto ConfigStore::load() const -> AppConfig
{
    auto const path = configPath();
    if (!path)
    {
        log::warning("{}, using defaults", path.error().message);
        return AppConfig {};
    }

    auto ec = std::error_code {};
    if (!std::filesystem::exists(*path, ec))
    {
        auto const defaults = AppConfig {};
        if (auto saved = save(defaults); !saved)
            log::error("Failed to create default config: {}", saved.error().message);
        else
            log::info("Created default config at {}", path->string());
        return defaults;
    }

    auto loaded = loadFromFile(*path);
    if (!loaded)
    {
        log::error("Failed to load config from {}: {}, using defaults", path->string(), loaded.error().message);
        return AppConfig {};
    }

    log::info("Loaded config from {}", path->string());
    return *loaded;
}

auto ConfigStore::ensureDirectory() const -> Result<std::filesystem::path>
{
    auto dir = configDir();
    if (!dir)
        return dir;

    auto ec = std::error_code {};
    std::filesystem::create_directories(*dir, ec);
    if (ec)
        return makeError(ErrorCode::ConfigWriteError,
                         std::format("Failed to create config directory '{}': {}", dir->string(), ec.message()));
    return dir;
}

auto ConfigStore::save(const AppConfig& config) const -> VoidResult
{
    auto dir = ensureDirectory();
    if (!dir)
        return std::unexpected(dir.error());

    auto const content = serializeConfig(config);
    auto const path = *dir / ConfigFileName;
    auto const tempPath = *dir / std::format("{}.{}.tmp", ConfigFileName, generateUuid().substr(0, 8));

    {
        auto file = std::ofstream(tempPath, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
            return makeError(ErrorCode::ConfigWriteError,
                             std::format("Cannot write config file: {}", tempPath.string()));

        file << content;
        file.flush();
        if (!file)
        {
            file.close();
            auto ec = std::error_code {};
            std::filesystem::remove(tempPath, ec);
            return makeError(ErrorCode::ConfigWriteError,
                             std::format("Failed to write config file: {}", tempPath.string()));
        }
    }

    auto ec = std::error_code {};
    std::filesystem::rename(tempPath, path, ec);
    if (ec)
    {
        auto removeEc = std::error_code {};
        std::filesystem::remove(tempPath, removeEc);
        return makeError(ErrorCode::ConfigWriteError,
                         std::format("Failed to replace config file '{}': {}", path.string(), ec.message()));
    }

    log::debug("Saved config to {}", path.string());
    return {};
}

} // namespace onyx

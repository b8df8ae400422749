// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <onyx/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "MockPlatform.hpp"

using namespace onyx;

namespace
{

auto readFile(const std::filesystem::path& path) -> std::string
{
    auto file = std::ifstream(path);
    auto ss = std::stringstream {};
    ss << file.rdbuf();
    return ss.str();
}

void writeFile(const std::filesystem::path& path, std::string_view content)
{
    std::filesystem::create_directories(path.parent_path());
    auto file = std::ofstream(path);
    file << content;
}

} // namespace

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.serverUrl == "https://cloud.onyx.app");
    CHECK(config.windowTitle == "Onyx");
}

TEST_CASE("validateServerUrl accepts http and https URLs", "[config]")
{
    SECTION("https")
    {
        auto result = validateServerUrl("https://onyx.example.com");
        REQUIRE(result.has_value());
        CHECK(*result == "https://onyx.example.com");
    }

    SECTION("http with port and path")
    {
        auto result = validateServerUrl("http://localhost:3000/app");
        REQUIRE(result.has_value());
        CHECK(*result == "http://localhost:3000/app");
    }

    SECTION("trailing slashes are stripped")
    {
        CHECK(validateServerUrl("https://onyx.example.com/").value() == "https://onyx.example.com");
        CHECK(validateServerUrl("https://onyx.example.com///").value() == "https://onyx.example.com");
    }
}

TEST_CASE("validateServerUrl rejects invalid URLs", "[config]")
{
    for (auto const* url: { "", "onyx.example.com", "ftp://onyx.example.com", "https://", "https:///path",
                            "https://onyx example.com", "HTTPS://onyx.example.com" })
    {
        auto result = validateServerUrl(url);
        INFO(url);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ValidationError);
    }
}

TEST_CASE("validateServerUrl rejects invalid UTF-8", "[config]")
{
    auto result = validateServerUrl("https://bad\xff.example");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ValidationError);
}

TEST_CASE("serializeConfig replaces invalid UTF-8 instead of throwing", "[config]")
{
    auto const text = serializeConfig(AppConfig { .serverUrl = "https://a.example", .windowTitle = "Bad\xff" });
    CHECK(text.find("\"window_title\"") != std::string::npos);
    CHECK(parseConfig(text).has_value());
}

TEST_CASE("parseConfig reads both fields", "[config]")
{
    auto result = parseConfig(R"({"server_url": "https://onyx.internal/", "window_title": "Work"})");
    REQUIRE(result.has_value());
    CHECK(result->serverUrl == "https://onyx.internal");
    CHECK(result->windowTitle == "Work");
}

TEST_CASE("parseConfig defaults a missing window_title", "[config]")
{
    auto result = parseConfig(R"({"server_url": "http://localhost:3000"})");
    REQUIRE(result.has_value());
    CHECK(result->windowTitle == "Onyx");
}

TEST_CASE("parseConfig ignores unknown fields", "[config]")
{
    auto result = parseConfig(R"({"server_url": "https://a.example", "theme": "dark", "zoom": 1.5})");
    REQUIRE(result.has_value());
    CHECK(result->serverUrl == "https://a.example");
}

TEST_CASE("parseConfig reports malformed content", "[config]")
{
    SECTION("not JSON")
    {
        auto result = parseConfig("{not json");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigParseError);
    }

    SECTION("missing server_url")
    {
        auto result = parseConfig(R"({"window_title": "Onyx"})");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigParseError);
    }

    SECTION("invalid server_url")
    {
        auto result = parseConfig(R"({"server_url": "onyx.example.com"})");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigParseError);
    }

    SECTION("window_title of the wrong type")
    {
        auto result = parseConfig(R"({"server_url": "https://a.example", "window_title": 42})");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigParseError);
    }

    SECTION("root is not an object")
    {
        auto result = parseConfig(R"(["https://a.example"])");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigParseError);
    }
}

TEST_CASE("serializeConfig writes pretty-printed JSON with server_url first", "[config]")
{
    auto const text = serializeConfig(AppConfig { .serverUrl = "https://x.example", .windowTitle = "X" });
    CHECK(text.find("\"server_url\"") < text.find("\"window_title\""));
    CHECK(text.find("\n  \"server_url\": \"https://x.example\"") != std::string::npos);
    CHECK(text.ends_with("\n"));

    auto reparsed = parseConfig(text);
    REQUIRE(reparsed.has_value());
    CHECK(reparsed->windowTitle == "X");
}

TEST_CASE("ConfigStore path ends with config.json", "[config]")
{
    auto const dir = test::TempDir {};
    auto const store = ConfigStore { dir.path() };
    auto const path = store.configPath();
    REQUIRE(path.has_value());
    CHECK(path->filename() == "config.json");
    CHECK(path->parent_path() == dir.path());
}

TEST_CASE("ConfigStore without a directory reports it as unresolvable", "[config]")
{
    auto const store = ConfigStore { std::nullopt };

    auto const path = store.configPath();
    REQUIRE(!path.has_value());
    CHECK(path.error().code == ErrorCode::ConfigDirectoryUnresolvable);

    auto const saved = store.save(AppConfig {});
    REQUIRE(!saved.has_value());
    CHECK(saved.error().code == ErrorCode::ConfigDirectoryUnresolvable);

    CHECK(store.load() == AppConfig {});
}

TEST_CASE("ConfigStore load creates the file with defaults when missing", "[config]")
{
    auto const dir = test::TempDir {};
    auto const store = ConfigStore { dir.path() / "nested" };

    auto const config = store.load();
    CHECK(config == AppConfig {});

    auto const path = dir.path() / "nested" / "config.json";
    REQUIRE(std::filesystem::exists(path));
    auto const reloaded = ConfigStore::loadFromFile(path);
    REQUIRE(reloaded.has_value());
    CHECK(*reloaded == AppConfig {});
}

TEST_CASE("ConfigStore load falls back to defaults and leaves a corrupt file untouched", "[config]")
{
    auto const dir = test::TempDir {};
    auto const path = dir.path() / "config.json";
    auto const corrupt = std::string { "{ \"server_url\": " };
    writeFile(path, corrupt);

    auto errors = std::vector<std::string> {};
    auto const sink = log::ScopedSink([&](log::Level level, std::string_view message) {
        if (level == log::Level::Error)
            errors.emplace_back(message);
    });

    auto const store = ConfigStore { dir.path() };
    CHECK(store.load() == AppConfig {});
    CHECK(readFile(path) == corrupt);
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].find("using defaults") != std::string::npos);
}

TEST_CASE("ConfigStore save then load returns the saved values", "[config]")
{
    auto const dir = test::TempDir {};
    auto const store = ConfigStore { dir.path() };
    auto const config = AppConfig { .serverUrl = "http://localhost:3000", .windowTitle = "Local" };

    REQUIRE(store.save(config).has_value());
    CHECK(store.load() == config);

    SECTION("no temporary files are left behind")
    {
        auto count = 0;
        for (auto const& entry: std::filesystem::directory_iterator(dir.path()))
        {
            CHECK(entry.path().filename() == "config.json");
            ++count;
        }
        CHECK(count == 1);
    }
}

TEST_CASE("loadFromFile reports a missing file as an I/O error", "[config]")
{
    auto const dir = test::TempDir {};
    auto const result = ConfigStore::loadFromFile(dir.path() / "absent.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::IoError);
}

#if defined(__linux__)
TEST_CASE("platformConfigDir honours XDG_CONFIG_HOME", "[config]")
{
    auto const* const previous = std::getenv("XDG_CONFIG_HOME");
    auto const saved = previous ? std::optional<std::string>(previous) : std::nullopt;

    SECTION("absolute value is used")
    {
        ::setenv("XDG_CONFIG_HOME", "/tmp/onyx-xdg", 1);
        auto const dir = platformConfigDir();
        REQUIRE(dir.has_value());
        CHECK(*dir == std::filesystem::path("/tmp/onyx-xdg/desktop"));
    }

    SECTION("relative value is ignored")
    {
        ::setenv("XDG_CONFIG_HOME", "relative/dir", 1);
        auto const dir = platformConfigDir();
        if (dir)
            CHECK(dir->is_absolute());
    }

    if (saved)
        ::setenv("XDG_CONFIG_HOME", saved->c_str(), 1);
    else
        ::unsetenv("XDG_CONFIG_HOME");
}
#endif

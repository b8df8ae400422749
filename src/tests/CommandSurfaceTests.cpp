// SPDX-License-Identifier: Apache-2.0
#include <onyx/CommandSurface.hpp>
#include <onyx/ConfigState.hpp>
#include <onyx/Scripts.hpp>
#include <onyx/WindowController.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>

#include "MockPlatform.hpp"

using namespace onyx;

namespace
{

struct Fixture
{
    test::TempDir dir;
    test::MockWindowBackend backend;
    test::MockPlatformEffects effects;
    test::ManualScheduler scheduler;
    ConfigStore store { dir.path() };
    ConfigState config { store, store.load() };
    WindowController windows { backend, effects, scheduler };
    CommandSurface commands { config, windows, effects };

    auto openMain() -> test::MockWebView&
    {
        REQUIRE(windows.startMainWindow("https://cloud.onyx.app", "Onyx").has_value());
        scheduler.pending.clear();
        return *backend.created.at("main");
    }
};

} // namespace

TEST_CASE("getServerUrl returns the default on first run", "[commands]")
{
    auto f = Fixture {};
    CHECK(f.commands.getServerUrl() == "https://cloud.onyx.app");
}

TEST_CASE("setServerUrl returns and persists the normalized URL", "[commands]")
{
    auto f = Fixture {};

    auto result = f.commands.setServerUrl("https://onyx.internal/");
    REQUIRE(result.has_value());
    CHECK(*result == "https://onyx.internal");
    CHECK(f.commands.getServerUrl() == "https://onyx.internal");
    CHECK(ConfigStore { f.dir.path() }.load().serverUrl == "https://onyx.internal");
}

TEST_CASE("setServerUrl rejects a URL without scheme", "[commands]")
{
    auto f = Fixture {};

    auto result = f.commands.setServerUrl("onyx.example.com");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ValidationError);
    CHECK(f.commands.getServerUrl() == "https://cloud.onyx.app");
}

TEST_CASE("getConfigPath points into the config directory", "[commands]")
{
    auto f = Fixture {};
    auto path = f.commands.getConfigPath();
    REQUIRE(path.has_value());
    CHECK(*path == (f.dir.path() / "config.json").string());
}

TEST_CASE("openConfigFile recreates a deleted file with the current config", "[commands]")
{
    auto f = Fixture {};
    REQUIRE(f.commands.setServerUrl("https://kept.example").has_value());
    std::filesystem::remove(f.dir.path() / "config.json");

    REQUIRE(f.commands.openConfigFile().has_value());
    REQUIRE(f.effects.editorOpened.size() == 1);
    CHECK(f.effects.editorOpened[0] == f.dir.path() / "config.json");
    CHECK(ConfigStore { f.dir.path() }.load().serverUrl == "https://kept.example");
}

TEST_CASE("openConfigDirectory creates and opens the directory", "[commands]")
{
    auto f = Fixture {};
    std::filesystem::remove_all(f.dir.path());

    REQUIRE(f.commands.openConfigDirectory().has_value());
    CHECK(std::filesystem::is_directory(f.dir.path()));
    CHECK(f.effects.folderOpened == std::vector<std::filesystem::path> { f.dir.path() });
}

TEST_CASE("Config commands fail without a config directory", "[commands]")
{
    test::MockWindowBackend backend;
    test::MockPlatformEffects effects;
    test::ManualScheduler scheduler;
    ConfigState config { ConfigStore { std::nullopt }, AppConfig {} };
    WindowController windows { backend, effects, scheduler };
    CommandSurface commands { config, windows, effects };

    CHECK(commands.getConfigPath().error().code == ErrorCode::ConfigDirectoryUnresolvable);
    CHECK(commands.openConfigFile().error().code == ErrorCode::ConfigDirectoryUnresolvable);
    CHECK(commands.openConfigDirectory().error().code == ErrorCode::ConfigDirectoryUnresolvable);
    CHECK(effects.editorOpened.empty());
}

TEST_CASE("navigateTo joins the server URL and path", "[commands]")
{
    auto f = Fixture {};
    auto& main = f.openMain();

    f.commands.navigateTo(main, "/chat/42");
    REQUIRE(main.scripts.size() == 1);
    CHECK(main.scripts[0] == scripts::navigate("https://cloud.onyx.app/chat/42"));
}

TEST_CASE("Navigation on a closed window is silently ignored", "[commands]")
{
    auto f = Fixture {};
    auto& main = f.openMain();
    f.backend.close("main");

    f.commands.reloadPage(main);
    f.commands.goBack(main);
    f.commands.goForward(main);
    f.commands.navigateTo(main, "/chat");
    CHECK(main.scripts.empty());
}

TEST_CASE("newWindow opens a window at the configured URL", "[commands]")
{
    auto f = Fixture {};
    REQUIRE(f.commands.setServerUrl("http://localhost:3000").has_value());

    REQUIRE(f.commands.newWindow().has_value());
    REQUIRE(f.backend.created.size() == 1);
    CHECK(f.backend.created.begin()->second->options.url == "http://localhost:3000");
}

TEST_CASE("resetConfig restores defaults", "[commands]")
{
    auto f = Fixture {};
    REQUIRE(f.commands.setServerUrl("https://other.example").has_value());

    REQUIRE(f.commands.resetConfig().has_value());
    CHECK(f.commands.getServerUrl() == "https://cloud.onyx.app");
    CHECK(ConfigStore { f.dir.path() }.load() == AppConfig {});
}

TEST_CASE("invoke dispatches by command name", "[commands]")
{
    auto f = Fixture {};
    auto& main = f.openMain();

    SECTION("get_server_url")
    {
        auto result = f.commands.invoke("get_server_url", nlohmann::json::object(), "main");
        REQUIRE(result.has_value());
        CHECK(*result == "https://cloud.onyx.app");
    }

    SECTION("set_server_url")
    {
        auto result = f.commands.invoke("set_server_url", { { "url", "https://x.example/" } }, "main");
        REQUIRE(result.has_value());
        CHECK(*result == "https://x.example");
    }

    SECTION("set_server_url without url")
    {
        auto result = f.commands.invoke("set_server_url", nlohmann::json::object(), "main");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("navigate_to targets the calling window")
    {
        auto result = f.commands.invoke("navigate_to", { { "path", "/chat" } }, "main");
        REQUIRE(result.has_value());
        CHECK(result->is_null());
        CHECK(main.scripts == std::vector<std::string> { scripts::navigate("https://cloud.onyx.app/chat") });
    }

    SECTION("start_drag_window")
    {
        REQUIRE(f.commands.invoke("start_drag_window", nlohmann::json::object(), "main").has_value());
        CHECK(main.dragCount == 1);
    }

    SECTION("window commands from an unknown window")
    {
        auto result = f.commands.invoke("reload_page", nlohmann::json::object(), "ghost");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::WindowNotFound);
    }

    SECTION("unknown command")
    {
        auto result = f.commands.invoke("format_disk", nlohmann::json::object(), "main");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("A stored server URL survives a restart", "[commands]")
{
    auto f = Fixture {};
    auto stored = f.commands.setServerUrl("https://example.com/");
    REQUIRE(stored.has_value());
    CHECK(*stored == "https://example.com");

    auto path = f.commands.getConfigPath();
    REQUIRE(path.has_value());
    CHECK(std::filesystem::path(*path).is_absolute());
    CHECK(path->ends_with("config.json"));

    auto restarted = ConfigStore { f.dir.path() };
    auto state = ConfigState { restarted, restarted.load() };
    CHECK(state.read().serverUrl == "https://example.com");
}

// SPDX-License-Identifier: Apache-2.0
#include <onyx/App.hpp>

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "MockPlatform.hpp"

using namespace onyx;

TEST_CASE("App initialize opens the main window and registers shortcuts", "[app]")
{
    auto const dir = test::TempDir {};
    auto backend = std::make_unique<test::MockWindowBackend>();
    auto shortcuts = std::make_unique<test::MockShortcutBackend>();
    auto* backendPtr = backend.get();
    auto* shortcutsPtr = shortcuts.get();

    {
        auto app = App(ConfigStore { dir.path() },
                       std::move(backend),
                       std::make_unique<test::MockPlatformEffects>(),
                       std::move(shortcuts));
        REQUIRE(app.initialize().has_value());

        REQUIRE(backendPtr->created.contains("main"));
        auto const& main = *backendPtr->created.at("main");
        CHECK(main.options.url == "https://cloud.onyx.app");
        CHECK(main.options.title == "Onyx");
        CHECK(main.focused);
        CHECK(shortcutsPtr->registered.size() == 6);

        SECTION("front-end messages reach the command surface")
        {
            REQUIRE(backendPtr->commandHandler);
            auto const reply = nlohmann::json::parse(
                backendPtr->commandHandler("main", R"({"id": 1, "command": "get_server_url"})"));
            CHECK(reply["ok"] == true);
            CHECK(reply["result"] == "https://cloud.onyx.app");
        }

        SECTION("run hands control to the backend")
        {
            CHECK(app.run() == 0);
            CHECK(backendPtr->runCount == 1);
        }

        // The first start writes the default config file.
        CHECK(std::filesystem::exists(dir.path() / "config.json"));
    }
}

TEST_CASE("App runs without a global shortcut backend", "[app]")
{
    auto const dir = test::TempDir {};
    auto backend = std::make_unique<test::MockWindowBackend>();
    auto* backendPtr = backend.get();

    auto app = App(ConfigStore { dir.path() }, std::move(backend), std::make_unique<test::MockPlatformEffects>(), nullptr);
    REQUIRE(app.initialize().has_value());
    CHECK(backendPtr->created.size() == 1);
}

TEST_CASE("App initialize fails when the main window cannot be created", "[app]")
{
    auto const dir = test::TempDir {};
    auto backend = std::make_unique<test::MockWindowBackend>();
    backend->failCreation = true;

    auto app = App(ConfigStore { dir.path() }, std::move(backend), std::make_unique<test::MockPlatformEffects>(), nullptr);
    auto const result = app.initialize();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::WindowCreationError);
}

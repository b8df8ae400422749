// SPDX-License-Identifier: Apache-2.0
#include <core/Uuid.hpp>
#include <platform/GtkMainThread.hpp>
#include <platform/GtkPlatformEffects.hpp>

#include <catch2/catch_test_macros.hpp>

#include <glib.h>

#include <memory>
#include <thread>

#include <platform/X11Atoms.hpp>

#include "MockPlatform.hpp"

using namespace onyx;

TEST_CASE("applyTranslucency without a window", "[platform]")
{
    auto effects = platform::GtkPlatformEffects {};
    auto result = effects.applyTranslucency(nullptr);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::WindowNotFound);
}

TEST_CASE("applyTranslucency outlives a main loop that has finished", "[platform]")
{
    auto* context = g_main_context_default();
    REQUIRE(g_main_context_acquire(context));
    platform::markMainThread();
    platform::markMainLoopFinished();

    auto window = std::make_shared<test::MockWebView>(WindowOptions { .label = "main" });
    auto effects = platform::GtkPlatformEffects {};

    SECTION("on the main thread the request runs at once")
    {
        auto result = effects.applyTranslucency(window);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::WindowNotFound);
        CHECK(window.use_count() == 1);
    }

    SECTION("from another thread the wait gives up and the queued task stays safe")
    {
        auto result = VoidResult {};
        {
            auto worker = std::jthread([&] { result = effects.applyTranslucency(window); });
        }
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::Unknown);

        // The queued task still holds the window.
        CHECK(window.use_count() > 1);

        while (g_main_context_iteration(context, FALSE))
        {
        }
        CHECK(window.use_count() == 1);
        CHECK(window->scripts.empty());
    }

    g_main_context_release(context);
}

TEST_CASE("existingAtom only finds atoms that were interned", "[platform]")
{
    CHECK(!platform::existingAtom(nullptr, "WM_NAME").has_value());

    auto* display = XOpenDisplay(nullptr);
    if (!display)
        SKIP("No X display available");

    CHECK(platform::existingAtom(display, "WM_NAME").has_value());

    auto const unused = "_ONYX_TEST_" + generateUuid();
    CHECK(!platform::existingAtom(display, unused.c_str()).has_value());

    XCloseDisplay(display);
}

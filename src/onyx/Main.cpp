// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <onyx/App.hpp>
#include <onyx/Config.hpp>
#include <platform/GtkPlatformEffects.hpp>
#include <platform/GtkWindowBackend.hpp>
#include <platform/X11ShortcutBackend.hpp>

#include <CLI/CLI.hpp>

#include <print>

int main(int argc, char** argv)
{
    auto app = CLI::App { "onyx-desktop - Desktop shell for the Onyx web application" };

    auto configDir = std::string {};
    auto logLevel = std::string {};
    auto verbose = false;
    auto printConfigPath = false;

    app.add_option("--config-dir", configDir, "Directory holding config.json (overrides the platform default)");
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--print-config-path", printConfigPath, "Print the config file path and exit");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        onyx::log::setLevel(onyx::log::Level::Debug);
    if (!logLevel.empty())
    {
        auto const level = onyx::log::levelFromString(logLevel);
        if (!level)
        {
            onyx::log::error("Unknown log level: {}", logLevel);
            return 1;
        }
        onyx::log::setLevel(*level);
    }

    auto store = configDir.empty() ? onyx::ConfigStore {} : onyx::ConfigStore { std::filesystem::path(configDir) };

    if (printConfigPath)
    {
        auto const path = store.configPath();
        if (!path)
        {
            onyx::log::error("{}", path.error().message);
            return 1;
        }
        std::println("{}", path->string());
        return 0;
    }

    auto backend = onyx::platform::GtkWindowBackend::create();
    if (!backend)
    {
        onyx::log::error("Failed to start: {}", backend.error().message);
        return 1;
    }

    auto shortcuts = std::unique_ptr<onyx::GlobalShortcutBackend> {};
    if (auto x11 = onyx::platform::X11ShortcutBackend::create(); x11)
        shortcuts = std::move(*x11);
    else
        onyx::log::warning("Global shortcuts disabled: {}", x11.error().message);

    auto application = onyx::App(std::move(store),
                                  std::move(*backend),
                                  std::make_unique<onyx::platform::GtkPlatformEffects>(),
                                  std::move(shortcuts));
    auto initResult = application.initialize();
    if (!initResult)
    {
        onyx::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}

// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Log.hpp>
#include <core/TaskScheduler.hpp>
#include <onyx/CommandBridge.hpp>
#include <onyx/CommandSurface.hpp>
#include <onyx/ConfigState.hpp>
#include <onyx/WindowController.hpp>

namespace onyx
{

struct App::Impl
{
    std::unique_ptr<WindowBackend> backend;
    std::unique_ptr<PlatformEffects> effects;
    std::unique_ptr<GlobalShortcutBackend> shortcutBackend;

    ConfigState config;
    ThreadTaskScheduler scheduler;
    WindowController windows;
    CommandSurface commands;
    ShortcutRouter shortcuts;

    Impl(ConfigStore store,
         std::unique_ptr<WindowBackend> windowBackend,
         std::unique_ptr<PlatformEffects> platformEffects,
         std::unique_ptr<GlobalShortcutBackend> globalShortcuts):
        backend(std::move(windowBackend)),
        effects(std::move(platformEffects)),
        shortcutBackend(std::move(globalShortcuts)),
        config(store, store.load()),
        windows(*backend, *effects, scheduler),
        commands(config, windows, *effects),
        shortcuts(config, windows, commands, scheduler)
    {
    }

    ~Impl()
    {
        // Stop everything that can call back into the members below.
        if (shortcutBackend)
            shortcutBackend->unregisterAll();
        scheduler.shutdown();
        backend->setCommandHandler({});
        backend->setClosedHandler({});
    }
};

App::App(ConfigStore store,
         std::unique_ptr<WindowBackend> windows,
         std::unique_ptr<PlatformEffects> effects,
         std::unique_ptr<GlobalShortcutBackend> shortcuts):
    _impl(std::make_unique<Impl>(std::move(store), std::move(windows), std::move(effects), std::move(shortcuts)))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    auto const config = _impl->config.read();
    log::info("Starting Onyx Desktop");
    log::info("Server URL: {}", config.serverUrl);
    if (auto path = _impl->config.store().configPath(); path)
        log::info("Config file: {}", path->string());
    else
        log::warning("No config location: {}", path.error().message);

    _impl->backend->setCommandHandler([this](const std::string& label, std::string_view message) {
        return bridge::handleMessage(_impl->commands, label, message);
    });

    auto mainWindow = _impl->windows.startMainWindow(config.serverUrl, config.windowTitle);
    if (!mainWindow)
        return std::unexpected(mainWindow.error());

    if (_impl->shortcutBackend)
    {
        auto const registered = _impl->shortcuts.registerAll(*_impl->shortcutBackend);
        log::info("Registered {} global shortcuts", registered);
    }
    else
    {
        log::info("Global shortcuts are not available on this platform");
    }

    return {};
}

auto App::run() -> int
{
    _impl->backend->run();
    log::info("Event loop finished");
    return 0;
}

} // namespace onyx

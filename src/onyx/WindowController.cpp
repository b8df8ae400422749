// SPDX-License-Identifier: Apache-2.0
#include "WindowController.hpp"

#include <core/Log.hpp>
#include <core/Uuid.hpp>
#include <onyx/Config.hpp>
#include <onyx/Scripts.hpp>

#include <format>

namespace onyx
{

WindowController::WindowController(WindowBackend& backend,
                                   PlatformEffects& effects,
                                   TaskScheduler& scheduler,
                                   ChromeInjectionPolicy policy):
    _backend(backend), _effects(effects), _scheduler(scheduler), _policy(policy)
{
    _backend.setClosedHandler([this](const std::string& label) { windowClosed(label); });
}

auto WindowController::createWindow(std::string_view url, std::string_view title, std::string label)
    -> Result<std::shared_ptr<WebView>>
{
    auto validUrl = validateServerUrl(url);
    if (!validUrl)
        return makeError(ErrorCode::WindowCreationError,
                         std::format("Invalid URL '{}': {}", url, validUrl.error().message));

    if (label.empty())
        label = std::format("onyx-{}", generateUuid());

    {
        auto const lock = std::lock_guard(_mutex);
        if (_windows.contains(label))
            return makeError(ErrorCode::WindowCreationError, std::format("Window '{}' already exists", label));
    }

    auto options = WindowOptions {
        .label = label,
        .url = std::move(*validUrl),
        .title = std::string(title),
        .initScript = scripts::bridge(),
    };

    auto created = _backend.createWindow(options);
    if (!created)
    {
        log::error("Failed to create window '{}': {}", label, created.error().message);
        if (created.error().code == ErrorCode::WindowCreationError)
            return created;
        return makeError(ErrorCode::WindowCreationError, created.error().message);
    }

    auto window = *created;

    if (auto translucent = _effects.applyTranslucency(window); !translucent)
        log::debug("Translucency not applied to '{}': {}", label, translucent.error().message);

    {
        auto const lock = std::lock_guard(_mutex);
        _windows[label] = window;
    }

    log::info("Created window '{}' at {}", label, options.url);
    return window;
}

void WindowController::injectChrome(const std::shared_ptr<WebView>& window, std::string script)
{
    if (!window || _policy.attempts <= 0)
        return;
    scheduleInjection(window, std::make_shared<const std::string>(std::move(script)), 0);
}

void WindowController::scheduleInjection(std::weak_ptr<WebView> window,
                                         std::shared_ptr<const std::string> script,
                                         int attempt)
{
    if (attempt >= _policy.attempts)
        return;

    _scheduler.schedule(_policy.delayFor(attempt),
                        [this, window = std::move(window), script = std::move(script), attempt] {
                            auto target = window.lock();
                            if (!target || !target->isOpen())
                                return;

                            if (auto result = target->evaluateScript(*script); !result)
                                log::trace("Chrome injection attempt {} on '{}' failed: {}",
                                           attempt + 1,
                                           target->label(),
                                           result.error().message);

                            scheduleInjection(window, script, attempt + 1);
                        });
}

auto WindowController::openWindow(std::string_view url, std::string_view title) -> Result<std::shared_ptr<WebView>>
{
    auto window = createWindow(url, title);
    if (window)
        injectChrome(*window, scripts::titleBar(title));
    return window;
}

auto WindowController::startMainWindow(std::string_view url, std::string_view title)
    -> Result<std::shared_ptr<WebView>>
{
    auto window = createWindow(url, title, std::string(MainWindowLabel));
    if (!window)
        return window;

    injectChrome(*window, scripts::titleBar(title));
    (*window)->setFocus();
    return window;
}

auto WindowController::navigate(WebView& window, std::string_view url) -> VoidResult
{
    log::debug("Navigating '{}' to {}", window.label(), url);
    return window.evaluateScript(scripts::navigate(url));
}

auto WindowController::reload(WebView& window) -> VoidResult
{
    return window.evaluateScript(scripts::Reload);
}

auto WindowController::goBack(WebView& window) -> VoidResult
{
    return window.evaluateScript(scripts::GoBack);
}

auto WindowController::goForward(WebView& window) -> VoidResult
{
    return window.evaluateScript(scripts::GoForward);
}

auto WindowController::window(std::string_view label) const -> std::shared_ptr<WebView>
{
    auto const lock = std::lock_guard(_mutex);
    auto const it = _windows.find(label);
    if (it == _windows.end() || !it->second->isOpen())
        return nullptr;
    return it->second;
}

auto WindowController::mainWindow() const -> std::shared_ptr<WebView>
{
    return window(MainWindowLabel);
}

auto WindowController::labels() const -> std::vector<std::string>
{
    auto const lock = std::lock_guard(_mutex);
    auto result = std::vector<std::string> {};
    for (const auto& [label, window]: _windows)
        result.push_back(label);
    return result;
}

void WindowController::windowClosed(const std::string& label)
{
    auto const lock = std::lock_guard(_mutex);
    if (_windows.erase(label) > 0)
        log::info("Window '{}' closed", label);
}

} // namespace onyx

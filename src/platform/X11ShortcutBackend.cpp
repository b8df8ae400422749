// SPDX-License-Identifier: Apache-2.0
#include "X11ShortcutBackend.hpp"

#include <core/Log.hpp>

#include <X11/Xlib.h>
#include <X11/keysym.h>

#include <poll.h>

#include <array>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <format>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace onyx::platform
{

namespace
{
    // NumLock and CapsLock must not stop a chord from matching, so every
    // grab is repeated with each combination of them.
    constexpr auto IgnoredMasks = std::array<unsigned int, 4> {
        0,
        LockMask,
        Mod2Mask,
        LockMask | Mod2Mask,
    };

    constexpr auto RelevantMasks = ShiftMask | ControlMask | Mod1Mask | Mod4Mask;

    constexpr auto PollInterval = 100; // ms

    std::atomic<bool> grabFailed = false;

    auto trapGrabError(Display* /*display*/, XErrorEvent* event) -> int
    {
        if (event->error_code == BadAccess)
            grabFailed = true;
        return 0;
    }

    auto keysymFor(std::string_view key) -> KeySym
    {
        if (key.size() == 1)
        {
            switch (key[0])
            {
                case '[': return XK_bracketleft;
                case ']': return XK_bracketright;
                case ',': return XK_comma;
                case '.': return XK_period;
                case '/': return XK_slash;
                case '\\': return XK_backslash;
                case ';': return XK_semicolon;
                case '\'': return XK_apostrophe;
                case '-': return XK_minus;
                case '=': return XK_equal;
                case '+': return XK_plus;
                case '`': return XK_grave;
                default: break;
            }
            auto const lower = std::string(1, static_cast<char>(std::tolower(static_cast<unsigned char>(key[0]))));
            return XStringToKeysym(lower.c_str());
        }
        return XStringToKeysym(std::string(key).c_str());
    }

    auto x11Modifiers(KeyMod mods) -> unsigned int
    {
        auto result = 0u;
        if (hasMod(mods, KeyMod::Super))
            result |= Mod4Mask;
        if (hasMod(mods, KeyMod::Control))
            result |= ControlMask;
        if (hasMod(mods, KeyMod::Alt))
            result |= Mod1Mask;
        if (hasMod(mods, KeyMod::Shift))
            result |= ShiftMask;
        return result;
    }
} // namespace

struct X11ShortcutBackend::Impl
{
    struct Grab
    {
        KeyCode keycode;
        unsigned int modifiers;
        std::function<void()> callback;
    };

    Display* display = nullptr;
    Window root = 0;
    std::mutex mutex;
    std::vector<Grab> grabs;
    std::jthread eventThread;

    ~Impl()
    {
        eventThread.request_stop();
        if (eventThread.joinable())
            eventThread.join();
        if (display)
            XCloseDisplay(display);
    }

    void ungrabAll()
    {
        for (auto const& grab: grabs)
            for (auto const ignored: IgnoredMasks)
                XUngrabKey(display, grab.keycode, grab.modifiers | ignored, root);
        XSync(display, False);
        grabs.clear();
    }

    void eventLoop(std::stop_token stopToken)
    {
        auto fd = pollfd { .fd = ConnectionNumber(display), .events = POLLIN, .revents = 0 };
        while (!stopToken.stop_requested())
        {
            if (poll(&fd, 1, PollInterval) < 0 && errno != EINTR)
            {
                log::error("Shortcut event loop stopped: {}", std::strerror(errno));
                return;
            }

            auto const lock = std::lock_guard(mutex);
            while (XPending(display) > 0)
            {
                auto event = XEvent {};
                XNextEvent(display, &event);
                if (event.type != KeyPress)
                    continue;

                auto const modifiers = event.xkey.state & RelevantMasks;
                for (auto const& grab: grabs)
                {
                    if (grab.keycode == event.xkey.keycode && grab.modifiers == modifiers)
                    {
                        grab.callback();
                        break;
                    }
                }
            }
        }
    }
};

X11ShortcutBackend::X11ShortcutBackend(): _impl(std::make_unique<Impl>())
{
}

X11ShortcutBackend::~X11ShortcutBackend()
{
    if (_impl->display)
        unregisterAll();
}

auto X11ShortcutBackend::create() -> Result<std::unique_ptr<X11ShortcutBackend>>
{
    auto* display = XOpenDisplay(nullptr);
    if (!display)
        return makeError(ErrorCode::ShortcutRegistrationError, "Cannot connect to the X server");

    auto backend = std::unique_ptr<X11ShortcutBackend>(new X11ShortcutBackend());
    auto& impl = *backend->_impl;
    impl.display = display;
    impl.root = DefaultRootWindow(display);
    XSelectInput(display, impl.root, KeyPressMask);
    impl.eventThread = std::jthread([&impl](std::stop_token stopToken) { impl.eventLoop(std::move(stopToken)); });
    return backend;
}

auto X11ShortcutBackend::registerShortcut(const Chord& chord, std::function<void()> callback) -> VoidResult
{
    auto const keysym = keysymFor(chord.key);
    if (keysym == NoSymbol)
        return makeError(ErrorCode::ShortcutRegistrationError, std::format("Unknown key '{}'", chord.key));

    auto const lock = std::lock_guard(_impl->mutex);
    auto* display = _impl->display;
    auto const keycode = XKeysymToKeycode(display, keysym);
    if (keycode == 0)
        return makeError(ErrorCode::ShortcutRegistrationError,
                         std::format("Key '{}' is not on the current keyboard layout", chord.key));

    auto const modifiers = x11Modifiers(chord.mods);

    XSync(display, False);
    grabFailed = false;
    auto* previousHandler = XSetErrorHandler(trapGrabError);
    for (auto const ignored: IgnoredMasks)
        XGrabKey(display, keycode, modifiers | ignored, _impl->root, True, GrabModeAsync, GrabModeAsync);
    XSync(display, False);
    XSetErrorHandler(previousHandler);

    if (grabFailed)
    {
        for (auto const ignored: IgnoredMasks)
            XUngrabKey(display, keycode, modifiers | ignored, _impl->root);
        XSync(display, False);
        return makeError(ErrorCode::ShortcutRegistrationError,
                         std::format("{} is already grabbed by another client", chord.toString()));
    }

    _impl->grabs.push_back({ .keycode = keycode, .modifiers = modifiers, .callback = std::move(callback) });
    return {};
}

void X11ShortcutBackend::unregisterAll()
{
    auto const lock = std::lock_guard(_impl->mutex);
    _impl->ungrabAll();
}

} // namespace onyx::platform

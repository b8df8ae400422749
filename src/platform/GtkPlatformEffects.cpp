// SPDX-License-Identifier: Apache-2.0
#include "GtkPlatformEffects.hpp"

#include <core/Log.hpp>
#include <core/Process.hpp>

#include <gtk/gtk.h>
#include <gdk/gdkx.h>
#include <X11/Xatom.h>
#include <X11/Xlib.h>

#include <format>

#include "GtkMainThread.hpp"
#include "X11Atoms.hpp"

namespace onyx::platform
{

namespace
{
    /// Must run on the GTK main thread.
    auto requestBlurBehind(GtkWidget* widget) -> VoidResult
    {
        auto* screen = gtk_widget_get_screen(widget);
        if (!gdk_screen_is_composited(screen))
            return makeError(ErrorCode::Unknown, "No compositing manager is running");

        auto* display = gtk_widget_get_display(widget);
        if (!GDK_IS_X11_DISPLAY(display))
            return makeError(ErrorCode::Unknown, "Blur behind is only supported on X11");

        auto* gdkWindow = gtk_widget_get_window(widget);
        if (!gdkWindow)
            return makeError(ErrorCode::Unknown, "Window is not realized");

        auto* xdisplay = gdk_x11_display_get_xdisplay(display);
        auto const xid = gdk_x11_window_get_xid(gdkWindow);
        // KWin interns the atom when it supports the effect.
        auto const atom = existingAtom(xdisplay, "_KDE_NET_WM_BLUR_BEHIND_REGION");
        if (!atom)
            return makeError(ErrorCode::Unknown, "Compositor does not support blur behind");

        // An empty region blurs the whole window.
        XChangeProperty(xdisplay, xid, *atom, XA_CARDINAL, 32, PropModeReplace, nullptr, 0);
        XFlush(xdisplay);
        return {};
    }

    auto launchOpener(const std::filesystem::path& path) -> VoidResult
    {
        log::debug("Opening {}", path.string());
        return process::spawnDetached("xdg-open", { path.string() });
    }
} // namespace

auto GtkPlatformEffects::applyTranslucency(const std::shared_ptr<WebView>& window) -> VoidResult
{
    if (!window)
        return makeError(ErrorCode::WindowNotFound, "No window given");

    // Shared with the queued task, which may run after a wait that gave up.
    auto result = std::make_shared<VoidResult>(makeError(ErrorCode::Unknown, "GTK main loop is not running"));
    auto const ran = invokeOnMainThreadAndWait([window, result] {
        auto* widget = static_cast<GtkWidget*>(window->nativeHandle());
        if (!widget)
        {
            *result = makeError(ErrorCode::WindowNotFound, std::format("Window '{}' is closed", window->label()));
            return;
        }
        *result = requestBlurBehind(widget);
    });
    if (!ran)
    {
        log::trace("Translucency for '{}' skipped, main loop finished", window->label());
        return makeError(ErrorCode::Unknown, "GTK main loop is not running");
    }
    return *result;
}

auto GtkPlatformEffects::openInEditor(const std::filesystem::path& path) -> VoidResult
{
    return launchOpener(path);
}

auto GtkPlatformEffects::openInFileManager(const std::filesystem::path& path) -> VoidResult
{
    return launchOpener(path);
}

} // namespace onyx::platform

// SPDX-License-Identifier: Apache-2.0
#include "GtkWindowBackend.hpp"

#include <core/Log.hpp>
#include <onyx/Scripts.hpp>

#include <gtk/gtk.h>
#include <webkit2/webkit2.h>

#include <atomic>
#include <format>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "GtkMainThread.hpp"

namespace onyx::platform
{

namespace
{
    void onWindowDestroyed(GtkWidget* widget, gpointer data);
    void onScriptMessage(WebKitUserContentManager* manager, WebKitJavascriptResult* result, gpointer data);
} // namespace

/// @brief A GTK toplevel hosting a single WebKitWebView.
///
/// Widget pointers are only touched on the GTK main thread, and only while
/// the window is open.
class GtkWebView final: public WebView, public std::enable_shared_from_this<GtkWebView>
{
  public:
    GtkWebView(std::string label, GtkWindowBackend::Impl& backend): _label(std::move(label)), _backend(backend) {}

    [[nodiscard]] auto label() const -> std::string override { return _label; }

    [[nodiscard]] auto evaluateScript(std::string_view script) -> VoidResult override
    {
        if (!_open)
            return makeError(ErrorCode::ScriptError, std::format("Window '{}' is closed", _label));

        invokeOnMainThread([self = weak_from_this(), script = std::string(script)] {
            auto view = self.lock();
            if (!view || !view->_open)
                return;
            webkit_web_view_evaluate_javascript(
                view->_webView, script.c_str(), -1, nullptr, nullptr, nullptr, nullptr, nullptr);
        });
        return {};
    }

    [[nodiscard]] auto isOpen() const -> bool override { return _open; }

    [[nodiscard]] auto startDragging() -> VoidResult override
    {
        if (!_open)
            return makeError(ErrorCode::WindowNotFound, std::format("Window '{}' is closed", _label));

        invokeOnMainThread([self = weak_from_this()] {
            auto view = self.lock();
            if (!view || !view->_open)
                return;

            auto* seat = gdk_display_get_default_seat(gtk_widget_get_display(view->_window));
            auto* pointer = seat ? gdk_seat_get_pointer(seat) : nullptr;
            if (!pointer)
            {
                log::debug("No pointer device, cannot drag '{}'", view->_label);
                return;
            }

            gint rootX = 0;
            gint rootY = 0;
            gdk_device_get_position(pointer, nullptr, &rootX, &rootY);
            gtk_window_begin_move_drag(
                GTK_WINDOW(view->_window), GDK_BUTTON_PRIMARY, rootX, rootY, gtk_get_current_event_time());
        });
        return {};
    }

    void setFocus() override
    {
        invokeOnMainThread([self = weak_from_this()] {
            if (auto view = self.lock(); view && view->_open)
                gtk_window_present(GTK_WINDOW(view->_window));
        });
    }

    [[nodiscard]] auto nativeHandle() const -> void* override { return _open ? _window : nullptr; }

    /// @brief Builds and shows the widgets. Main thread only.
    void build(const WindowOptions& options);

    /// @brief Called from the "destroy" signal. Main thread only.
    void markClosed() { _open = false; }

    [[nodiscard]] auto backend() -> GtkWindowBackend::Impl& { return _backend; }

  private:
    std::string _label;
    GtkWindowBackend::Impl& _backend;
    GtkWidget* _window = nullptr;
    WebKitWebView* _webView = nullptr;
    std::atomic<bool> _open = false;
};

struct GtkWindowBackend::Impl
{
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<GtkWebView>> windows;
    WindowClosedHandler closedHandler;
    CommandHandler commandHandler;
    bool running = false;

    void windowDestroyed(GtkWebView& view)
    {
        view.markClosed();

        auto keepAlive = std::shared_ptr<GtkWebView> {};
        auto handler = WindowClosedHandler {};
        auto remaining = std::size_t { 0 };
        {
            auto const lock = std::lock_guard(mutex);
            if (auto it = windows.find(view.label()); it != windows.end())
            {
                keepAlive = std::move(it->second);
                windows.erase(it);
            }
            handler = closedHandler;
            remaining = windows.size();
        }

        if (handler)
            handler(view.label());

        if (remaining == 0 && running)
        {
            log::debug("Last window closed, leaving main loop");
            gtk_main_quit();
        }
    }

    void messageReceived(GtkWebView& view, std::string_view text)
    {
        auto handler = CommandHandler {};
        {
            auto const lock = std::lock_guard(mutex);
            handler = commandHandler;
        }
        if (!handler)
            return;

        auto const reply = handler(view.label(), text);
        if (auto delivered = view.evaluateScript(scripts::resolve(reply)); !delivered)
            log::trace("Reply to '{}' not delivered: {}", view.label(), delivered.error().message);
    }
};

void GtkWebView::build(const WindowOptions& options)
{
    auto* manager = webkit_user_content_manager_new();
    if (!options.initScript.empty())
    {
        auto* script = webkit_user_script_new(options.initScript.c_str(),
                                              WEBKIT_USER_CONTENT_INJECT_TOP_FRAME,
                                              WEBKIT_USER_SCRIPT_INJECT_AT_DOCUMENT_START,
                                              nullptr,
                                              nullptr);
        webkit_user_content_manager_add_script(manager, script);
        webkit_user_script_unref(script);
    }

    auto const signal = std::format("script-message-received::{}", scripts::BridgeHandlerName);
    g_signal_connect(manager, signal.c_str(), G_CALLBACK(onScriptMessage), this);
    webkit_user_content_manager_register_script_message_handler(manager,
                                                                std::string(scripts::BridgeHandlerName).c_str());

    _webView = WEBKIT_WEB_VIEW(webkit_web_view_new_with_user_content_manager(manager));
    g_object_unref(manager);

    _window = gtk_window_new(GTK_WINDOW_TOPLEVEL);
    gtk_window_set_title(GTK_WINDOW(_window), options.title.c_str());
    gtk_window_set_default_size(GTK_WINDOW(_window), options.width, options.height);

    auto hints = GdkGeometry {};
    hints.min_width = options.minWidth;
    hints.min_height = options.minHeight;
    gtk_window_set_geometry_hints(GTK_WINDOW(_window), nullptr, &hints, GDK_HINT_MIN_SIZE);

    if (options.hiddenTitleBar)
    {
        // A bare header bar keeps the window controls but drops the native title.
        auto* header = gtk_header_bar_new();
        gtk_header_bar_set_show_close_button(GTK_HEADER_BAR(header), TRUE);
        gtk_window_set_titlebar(GTK_WINDOW(_window), header);
    }

    if (options.transparent)
    {
        auto* screen = gtk_widget_get_screen(_window);
        auto* visual = gdk_screen_get_rgba_visual(screen);
        if (visual && gdk_screen_is_composited(screen))
        {
            gtk_widget_set_visual(_window, visual);
            gtk_widget_set_app_paintable(_window, TRUE);
            auto const clear = GdkRGBA { 0.0, 0.0, 0.0, 0.0 };
            webkit_web_view_set_background_color(_webView, &clear);
        }
        else
        {
            log::debug("No RGBA visual or compositor, window '{}' stays opaque", _label);
        }
    }

    gtk_container_add(GTK_CONTAINER(_window), GTK_WIDGET(_webView));
    g_signal_connect(_window, "destroy", G_CALLBACK(onWindowDestroyed), this);

    webkit_web_view_load_uri(_webView, options.url.c_str());
    gtk_widget_show_all(_window);
    _open = true;
}

namespace
{
    void onWindowDestroyed(GtkWidget* /*widget*/, gpointer data)
    {
        auto* view = static_cast<GtkWebView*>(data);
        view->backend().windowDestroyed(*view);
    }

    void onScriptMessage(WebKitUserContentManager* /*manager*/, WebKitJavascriptResult* result, gpointer data)
    {
        auto* value = webkit_javascript_result_get_js_value(result);
        if (!value || !jsc_value_is_string(value))
            return;

        auto* text = jsc_value_to_string(value);
        auto const message = std::string(text ? text : "");
        g_free(text);

        auto* view = static_cast<GtkWebView*>(data);
        view->backend().messageReceived(*view, message);
    }
} // namespace

GtkWindowBackend::GtkWindowBackend(): _impl(std::make_unique<Impl>())
{
}

GtkWindowBackend::~GtkWindowBackend()
{
    auto remaining = std::vector<std::shared_ptr<GtkWebView>> {};
    {
        auto const lock = std::lock_guard(_impl->mutex);
        _impl->closedHandler = {};
        _impl->commandHandler = {};
        for (auto& [label, view]: _impl->windows)
            remaining.push_back(view);
    }

    if (!isMainThread())
        return;

    for (auto& view: remaining)
    {
        if (auto* widget = static_cast<GtkWidget*>(view->nativeHandle()))
            gtk_widget_destroy(widget);
    }
}

auto GtkWindowBackend::create() -> Result<std::unique_ptr<GtkWindowBackend>>
{
    if (!gtk_init_check(nullptr, nullptr))
        return makeError(ErrorCode::WindowCreationError, "Cannot initialize GTK (is a display available?)");

    markMainThread();
    return std::unique_ptr<GtkWindowBackend>(new GtkWindowBackend());
}

auto GtkWindowBackend::createWindow(const WindowOptions& options) -> Result<std::shared_ptr<WebView>>
{
    {
        auto const lock = std::lock_guard(_impl->mutex);
        if (_impl->windows.contains(options.label))
            return makeError(ErrorCode::WindowCreationError, std::format("Window '{}' already exists", options.label));
    }

    auto view = std::make_shared<GtkWebView>(options.label, *_impl);
    // The task may still run after a timed-out wait, so it owns everything it touches.
    auto const ran = invokeOnMainThreadAndWait([view, options] { view->build(options); });
    if (!ran || !view->isOpen())
        return makeError(ErrorCode::WindowCreationError,
                         std::format("Window '{}' could not be created: GTK main loop is not running", options.label));

    {
        auto const lock = std::lock_guard(_impl->mutex);
        _impl->windows[options.label] = view;
    }
    return view;
}

void GtkWindowBackend::setClosedHandler(WindowClosedHandler handler)
{
    auto const lock = std::lock_guard(_impl->mutex);
    _impl->closedHandler = std::move(handler);
}

void GtkWindowBackend::setCommandHandler(CommandHandler handler)
{
    auto const lock = std::lock_guard(_impl->mutex);
    _impl->commandHandler = std::move(handler);
}

void GtkWindowBackend::run()
{
    _impl->running = true;
    gtk_main();
    _impl->running = false;
    markMainLoopFinished();
}

void GtkWindowBackend::quit()
{
    invokeOnMainThread([this] {
        if (_impl->running)
            gtk_main_quit();
    });
}

} // namespace onyx::platform

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <onyx/WebView.hpp>

#include <memory>

namespace onyx::platform
{

/// @brief Window backend built on GTK 3 and WebKit2GTK.
///
/// Must be created on the thread that later calls run(). Windows can be
/// created from any thread; calls are marshalled onto the GTK main loop.
/// The event loop ends when the last window is closed.
class GtkWindowBackend: public WindowBackend
{
  public:
    ~GtkWindowBackend() override;

    GtkWindowBackend(const GtkWindowBackend&) = delete;
    GtkWindowBackend& operator=(const GtkWindowBackend&) = delete;

    /// @brief Initializes GTK on the calling thread.
    /// @return The backend, or an error if no display is available.
    [[nodiscard]] static auto create() -> Result<std::unique_ptr<GtkWindowBackend>>;

    [[nodiscard]] auto createWindow(const WindowOptions& options) -> Result<std::shared_ptr<WebView>> override;
    void setClosedHandler(WindowClosedHandler handler) override;
    void setCommandHandler(CommandHandler handler) override;
    void run() override;
    void quit() override;

    struct Impl;

  private:
    GtkWindowBackend();

    std::unique_ptr<Impl> _impl;
};

} // namespace onyx::platform

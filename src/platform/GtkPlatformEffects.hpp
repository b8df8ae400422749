// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <onyx/WebView.hpp>

namespace onyx::platform
{

/// @brief Platform effects for GTK desktops.
///
/// Translucency asks KDE's compositor to blur what lies behind the window.
/// Files and folders are handed to xdg-open.
class GtkPlatformEffects: public PlatformEffects
{
  public:
    [[nodiscard]] auto applyTranslucency(const std::shared_ptr<WebView>& window) -> VoidResult override;
    [[nodiscard]] auto openInEditor(const std::filesystem::path& path) -> VoidResult override;
    [[nodiscard]] auto openInFileManager(const std::filesystem::path& path) -> VoidResult override;
};

} // namespace onyx::platform

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace onyx::scripts
{

constexpr auto Reload = std::string_view { "window.location.reload()" };
constexpr auto GoBack = std::string_view { "window.history.back()" };
constexpr auto GoForward = std::string_view { "window.history.forward()" };

/// @brief Name of the script message handler the page posts commands to.
constexpr auto BridgeHandlerName = std::string_view { "onyx" };

/// @brief Returns a script that points the page at the given URL.
[[nodiscard]] auto navigate(std::string_view url) -> std::string;

/// @brief Returns the script that draws the custom title bar.
///
/// Safe to evaluate repeatedly: a page that already has the bar is left alone.
/// @param title Text shown in the bar.
[[nodiscard]] auto titleBar(std::string_view title) -> std::string;

/// @brief Returns the document-start script defining `window.onyx.invoke()`.
[[nodiscard]] auto bridge() -> std::string;

/// @brief Returns the script that delivers a reply object to the page's pending invoke().
[[nodiscard]] auto resolve(std::string_view replyJson) -> std::string;

} // namespace onyx::scripts

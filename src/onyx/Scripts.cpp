// SPDX-License-Identifier: Apache-2.0
#include "Scripts.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace onyx::scripts
{

namespace
{

    constexpr auto TitleBarTemplate = std::string_view { R"JS((function () {
  if (!document.body || document.getElementById('onyx-titlebar')) return;
  var bar = document.createElement('div');
  bar.id = 'onyx-titlebar';
  bar.style.cssText = 'position:fixed;top:0;left:0;right:0;height:28px;z-index:2147483647;' +
    'display:flex;align-items:center;justify-content:center;background:transparent;' +
    'font:12px system-ui,sans-serif;color:rgba(0,0,0,0.55);user-select:none;-webkit-user-select:none;';
  bar.textContent = __TITLE__;
  bar.addEventListener('mousedown', function (e) {
    if (e.button !== 0 || e.target !== bar || !window.onyx) return;
    window.onyx.invoke('start_drag_window').catch(function () {});
  });
  document.body.appendChild(bar);
  document.documentElement.style.setProperty('--onyx-titlebar-height', '28px');
})();)JS" };

    constexpr auto BridgeTemplate = std::string_view { R"JS((function () {
  if (window.onyx && window.onyx.__bridge) return;
  var pending = new Map();
  var nextId = 1;
  window.__onyxResolve = function (reply) {
    var entry = pending.get(reply.id);
    if (!entry) return;
    pending.delete(reply.id);
    if (reply.ok) entry.resolve(reply.result);
    else entry.reject(new Error(reply.error));
  };
  window.onyx = {
    __bridge: true,
    invoke: function (command, args) {
      return new Promise(function (resolve, reject) {
        var id = nextId++;
        pending.set(id, { resolve: resolve, reject: reject });
        window.webkit.messageHandlers.__HANDLER__.postMessage(
          JSON.stringify({ id: id, command: command, args: args || {} }));
      });
    }
  };
})();)JS" };

    auto replaceAll(std::string text, std::string_view token, std::string_view value) -> std::string
    {
        for (auto pos = text.find(token); pos != std::string::npos; pos = text.find(token, pos + value.size()))
            text.replace(pos, token.size(), value);
        return text;
    }

} // namespace

auto navigate(std::string_view url) -> std::string
{
    return std::format("window.location.href = {}", json::quote(url));
}

auto titleBar(std::string_view title) -> std::string
{
    return replaceAll(std::string(TitleBarTemplate), "__TITLE__", json::quote(title));
}

auto bridge() -> std::string
{
    return replaceAll(std::string(BridgeTemplate), "__HANDLER__", BridgeHandlerName);
}

auto resolve(std::string_view replyJson) -> std::string
{
    return std::format("window.__onyxResolve && window.__onyxResolve({})", replyJson);
}

} // namespace onyx::scripts

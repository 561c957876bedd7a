#pragma once

#include <span>
#include <string>
#include <string_view>

#include "ignyx/handler-descriptor.hpp"
#include "ignyx/http-method.hpp"
#include "ignyx/signature.hpp"
#include "ignyx/vector.hpp"
#include "ignyx/websocket-service.hpp"

namespace ignyx {

// Routes declared apart from the application and mounted under a prefix with App::includeRouter.
// Groups can be nested: including a group into another one prefixes its routes.
class RouteGroup {
 public:
  struct HttpRoute {
    http::MethodBmp methods;
    std::string pattern;
    Signature signature;
    Handler handler;
    std::string name;
  };

  struct WebSocketRoute {
    std::string pattern;
    WebSocketHandler handler;
    std::string name;
  };

  // 'prefix' is either empty or starts with '/' and does not end with '/'. Throws std::invalid_argument otherwise.
  explicit RouteGroup(std::string prefix = {});

  RouteGroup& route(http::MethodBmp methods, std::string_view pattern, Signature signature, Handler handler,
                    std::string name = {});

  RouteGroup& get(std::string_view pattern, Signature signature, Handler handler, std::string name = {}) {
    return route(static_cast<http::MethodBmp>(http::Method::GET), pattern, std::move(signature), std::move(handler),
                 std::move(name));
  }

  RouteGroup& get(std::string_view pattern, Handler handler, std::string name = {}) {
    return get(pattern, Signature{}, std::move(handler), std::move(name));
  }

  RouteGroup& post(std::string_view pattern, Signature signature, Handler handler, std::string name = {}) {
    return route(static_cast<http::MethodBmp>(http::Method::POST), pattern, std::move(signature),
                 std::move(handler), std::move(name));
  }

  RouteGroup& post(std::string_view pattern, Handler handler, std::string name = {}) {
    return post(pattern, Signature{}, std::move(handler), std::move(name));
  }

  RouteGroup& put(std::string_view pattern, Signature signature, Handler handler, std::string name = {}) {
    return route(static_cast<http::MethodBmp>(http::Method::PUT), pattern, std::move(signature), std::move(handler),
                 std::move(name));
  }

  RouteGroup& patch(std::string_view pattern, Signature signature, Handler handler, std::string name = {}) {
    return route(static_cast<http::MethodBmp>(http::Method::PATCH), pattern, std::move(signature),
                 std::move(handler), std::move(name));
  }

  RouteGroup& del(std::string_view pattern, Signature signature, Handler handler, std::string name = {}) {
    return route(static_cast<http::MethodBmp>(http::Method::DELETE), pattern, std::move(signature),
                 std::move(handler), std::move(name));
  }

  RouteGroup& websocket(std::string_view pattern, WebSocketHandler handler, std::string name = {});

  // Copies the routes of 'other' under this group, prefixed by 'prefix' then by the prefix of 'other'.
  RouteGroup& include(const RouteGroup& other, std::string_view prefix = {});

  [[nodiscard]] std::string_view prefix() const noexcept { return _prefix; }

  // Declared routes, with their full pattern (group prefix included).
  [[nodiscard]] std::span<const HttpRoute> httpRoutes() const noexcept {
    return {_httpRoutes.data(), _httpRoutes.size()};
  }

  [[nodiscard]] std::span<const WebSocketRoute> webSocketRoutes() const noexcept {
    return {_webSocketRoutes.data(), _webSocketRoutes.size()};
  }

  // Throws std::invalid_argument if 'prefix' is neither empty nor of the form "/segment[/segment...]".
  static void CheckPrefix(std::string_view prefix);

 private:
  std::string _prefix;
  vector<HttpRoute> _httpRoutes;
  vector<WebSocketRoute> _webSocketRoutes;
};

}  // namespace ignyx

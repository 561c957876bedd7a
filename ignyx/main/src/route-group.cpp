#include "ignyx/route-group.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace ignyx {

void RouteGroup::CheckPrefix(std::string_view prefix) {
  if (prefix.empty()) {
    return;
  }
  if (prefix.front() != '/') {
    throw std::invalid_argument("A route prefix must start with '/'");
  }
  if (prefix.back() == '/') {
    throw std::invalid_argument("A route prefix must not end with '/'");
  }
}

RouteGroup::RouteGroup(std::string prefix) : _prefix(std::move(prefix)) { CheckPrefix(_prefix); }

RouteGroup& RouteGroup::route(http::MethodBmp methods, std::string_view pattern, Signature signature, Handler handler,
                              std::string name) {
  if (methods == 0) {
    throw std::invalid_argument("A route needs at least one method");
  }
  _httpRoutes.push_back(
      HttpRoute{methods, _prefix + std::string(pattern), std::move(signature), std::move(handler), std::move(name)});
  return *this;
}

RouteGroup& RouteGroup::websocket(std::string_view pattern, WebSocketHandler handler, std::string name) {
  _webSocketRoutes.push_back(WebSocketRoute{_prefix + std::string(pattern), std::move(handler), std::move(name)});
  return *this;
}

RouteGroup& RouteGroup::include(const RouteGroup& other, std::string_view prefix) {
  CheckPrefix(prefix);
  const std::string fullPrefix = _prefix + std::string(prefix);
  for (const HttpRoute& httpRoute : other.httpRoutes()) {
    _httpRoutes.push_back(
        HttpRoute{httpRoute.methods, fullPrefix + httpRoute.pattern, httpRoute.signature, httpRoute.handler,
                  httpRoute.name});
  }
  for (const WebSocketRoute& wsRoute : other.webSocketRoutes()) {
    _webSocketRoutes.push_back(WebSocketRoute{fullPrefix + wsRoute.pattern, wsRoute.handler, wsRoute.name});
  }
  return *this;
}

}  // namespace ignyx

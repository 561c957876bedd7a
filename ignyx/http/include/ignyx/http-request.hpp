#pragma once

#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/http-headers.hpp"
#include "ignyx/http-method.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

class HttpRequestParser;

struct QueryParam {
  std::string key;
  std::string value;
};

struct PathParam {
  std::string name;
  std::string value;
};

// A fully received HTTP/1.x request. It owns all of its data so that it can travel from the reactor
// thread to the worker executing it.
class HttpRequest {
 public:
  HttpRequest() = default;

  // Builds a request without going through the wire parser. 'target' may contain a query string.
  static HttpRequest FromParts(http::Method method, std::string_view target,
                               std::initializer_list<std::pair<std::string_view, std::string_view>> headers = {},
                               std::string body = {});

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // Percent-decoded path, without query string.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Path as received, percent escapes kept. Routing matches on it.
  [[nodiscard]] std::string_view rawPath() const noexcept { return _rawPath; }

  // Raw query string (after '?', not decoded).
  [[nodiscard]] std::string_view rawQuery() const noexcept { return _rawQuery; }

  // "HTTP/1.1" or "HTTP/1.0"
  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  [[nodiscard]] const HeaderMap& headers() const noexcept { return _headers; }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return _headers.get(name);
  }

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return _headers.getOrEmpty(name);
  }

  // Decoded query parameters, in order of appearance. '+' is decoded as a space.
  [[nodiscard]] std::span<const QueryParam> queryParams() const noexcept { return {_query.data(), _query.size()}; }

  // First value of query parameter 'key'.
  [[nodiscard]] std::optional<std::string_view> queryParamValue(std::string_view key) const noexcept;

  [[nodiscard]] std::optional<std::string_view> cookieValue(std::string_view name) const noexcept;

  [[nodiscard]] std::span<const std::pair<std::string, std::string>> cookies() const noexcept {
    return {_cookies.data(), _cookies.size()};
  }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Filled once the router has matched the request.
  [[nodiscard]] std::span<const PathParam> pathParams() const noexcept {
    return {_pathParams.data(), _pathParams.size()};
  }

  [[nodiscard]] std::optional<std::string_view> pathParamValue(std::string_view name) const noexcept;

  void setPathParams(vector<PathParam> pathParams) noexcept { _pathParams = std::move(pathParams); }

  // HTTP/1.1 defaults to keep-alive unless 'Connection: close', HTTP/1.0 requires 'Connection: keep-alive'.
  [[nodiscard]] bool wantsKeepAlive() const noexcept;

  // True for a GET carrying 'Upgrade: websocket' and a 'Connection' header listing 'upgrade'.
  [[nodiscard]] bool isWebSocketUpgrade() const noexcept;

 private:
  friend class HttpRequestParser;

  // Splits 'target' into decoded path and query, and parses the Cookie header.
  // Returns false if the path contains an invalid percent escape.
  bool setTarget(std::string_view target);
  void parseCookies();

  http::Method _method{http::Method::GET};
  std::string _path{"/"};
  std::string _rawPath{"/"};
  std::string _rawQuery;
  std::string _version{"HTTP/1.1"};
  HeaderMap _headers;
  vector<QueryParam> _query;
  vector<std::pair<std::string, std::string>> _cookies;
  vector<PathParam> _pathParams;
  std::string _body;
};

}  // namespace ignyx

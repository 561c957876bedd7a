#include "ignyx/http-request.hpp"

#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/cookie.hpp"
#include "ignyx/http-constants.hpp"
#include "ignyx/http-method.hpp"
#include "ignyx/string-equal-ignore-case.hpp"
#include "ignyx/string-trim.hpp"
#include "ignyx/url-decode.hpp"

namespace ignyx {

namespace {

// True if the comma separated header value contains 'token' (case-insensitive).
bool HeaderListContains(std::string_view value, std::string_view token) {
  while (!value.empty()) {
    const auto commaPos = value.find(',');
    if (CaseInsensitiveEqual(Trim(value.substr(0, commaPos), kOws), token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    value.remove_prefix(commaPos + 1);
  }
  return false;
}

}  // namespace

HttpRequest HttpRequest::FromParts(http::Method method, std::string_view target,
                                   std::initializer_list<std::pair<std::string_view, std::string_view>> headers,
                                   std::string body) {
  HttpRequest request;
  request._method = method;
  for (const auto& [name, value] : headers) {
    request._headers.append(name, value);
  }
  if (!request.setTarget(target)) {
    throw std::invalid_argument("invalid request target");
  }
  request.parseCookies();
  request._body = std::move(body);
  return request;
}

bool HttpRequest::setTarget(std::string_view target) {
  const auto queryPos = target.find('?');
  auto decodedPath = url::Decode(target.substr(0, queryPos));
  if (!decodedPath) {
    return false;
  }
  _path = std::move(*decodedPath);
  _rawPath.assign(target.substr(0, queryPos));
  if (_rawPath.empty()) {
    _path = "/";
    _rawPath = "/";
  }
  _query.clear();
  if (queryPos != std::string_view::npos) {
    _rawQuery.assign(target.substr(queryPos + 1));
    for (auto& [key, value] : url::ParseQueryString(_rawQuery)) {
      _query.push_back(QueryParam{std::move(key), std::move(value)});
    }
  } else {
    _rawQuery.clear();
  }
  return true;
}

void HttpRequest::parseCookies() {
  _cookies.clear();
  for (std::string_view header : _headers.getAll(http::Cookie)) {
    for (auto& cookie : ParseCookieHeader(header)) {
      _cookies.push_back(std::move(cookie));
    }
  }
}

std::optional<std::string_view> HttpRequest::queryParamValue(std::string_view key) const noexcept {
  for (const QueryParam& param : _query) {
    if (param.key == key) {
      return std::string_view(param.value);
    }
  }
  return std::nullopt;
}

std::optional<std::string_view> HttpRequest::cookieValue(std::string_view name) const noexcept {
  for (const auto& [cookieName, value] : _cookies) {
    if (cookieName == name) {
      return std::string_view(value);
    }
  }
  return std::nullopt;
}

std::optional<std::string_view> HttpRequest::pathParamValue(std::string_view name) const noexcept {
  for (const PathParam& param : _pathParams) {
    if (param.name == name) {
      return std::string_view(param.value);
    }
  }
  return std::nullopt;
}

bool HttpRequest::wantsKeepAlive() const noexcept {
  const std::string_view connection = _headers.getOrEmpty(http::Connection);
  if (_version == http::HTTP10Sv) {
    return HeaderListContains(connection, http::keepalive);
  }
  return !HeaderListContains(connection, http::close);
}

bool HttpRequest::isWebSocketUpgrade() const noexcept {
  return _method == http::Method::GET && CaseInsensitiveEqual(_headers.getOrEmpty(http::Upgrade), http::websocket) &&
         HeaderListContains(_headers.getOrEmpty(http::Connection), http::upgrade);
}

}  // namespace ignyx

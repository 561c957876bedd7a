#pragma once

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#include "ignyx/http-headers.hpp"
#include "ignyx/http-method.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/json.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

// Exception carrying an HTTP status. Rendered as {"detail": detail} with the given headers.
class HttpException : public std::runtime_error {
 public:
  explicit HttpException(http::StatusCode status, std::string detail = {}, HeaderMap headers = {});

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] std::string_view detail() const noexcept { return _detail; }

  [[nodiscard]] const HeaderMap& headers() const noexcept { return _headers; }

 private:
  http::StatusCode _status;
  std::string _detail;
  HeaderMap _headers;
};

// No route matches the request path (404).
class RouteNotFound : public HttpException {
 public:
  RouteNotFound() : HttpException(http::StatusCodeNotFound, "Not Found") {}
};

// The path matches but not the method (405). Carries the Allow header.
class MethodNotAllowed : public HttpException {
 public:
  explicit MethodNotAllowed(http::MethodBmp allowedMethods);

  [[nodiscard]] http::MethodBmp allowedMethods() const noexcept { return _allowedMethods; }

 private:
  http::MethodBmp _allowedMethods;
};

// Element of a validation error location: a field name or an index.
using LocPart = std::variant<std::string, int64_t>;

struct FieldError {
  vector<LocPart> loc;
  std::string msg;
  std::string type;
  // Offending input, null when missing.
  Json input;

  [[nodiscard]] Json toJson() const;
};

// Parameter resolution failure (422), carrying every field error found in the request.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(vector<FieldError> errors);

  [[nodiscard]] std::span<const FieldError> errors() const noexcept { return {_errors.data(), _errors.size()}; }

  // {"detail": [{"loc": [...], "msg": "...", "type": "...", "input": ...}, ...]}
  [[nodiscard]] Json toJson() const;

 private:
  vector<FieldError> _errors;
};

// The call-lock could not be acquired before the configured deadline (503).
class LockTimeout : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// User code threw something that does not derive from std::exception.
class HandlerException : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Operation on a WebSocket session that is closed (or closing, for receives).
class ConnectionClosed : public std::runtime_error {
 public:
  explicit ConnectionClosed(uint16_t closeCode, std::string reason = {});

  [[nodiscard]] uint16_t closeCode() const noexcept { return _closeCode; }

  [[nodiscard]] std::string_view reason() const noexcept { return _reason; }

 private:
  uint16_t _closeCode;
  std::string _reason;
};

// The dependency graph contains a cycle. Thrown at registration time only.
class CyclicDependency : public std::logic_error {
 public:
  explicit CyclicDependency(vector<std::string> cycle);

  // Identities forming the cycle, the first one repeated at the end.
  [[nodiscard]] std::span<const std::string> cycle() const noexcept { return {_cycle.data(), _cycle.size()}; }

 private:
  vector<std::string> _cycle;
};

// HTTP status associated to an exception: the HttpException status, 422 for validation errors,
// 503 for lock timeouts and 500 otherwise.
[[nodiscard]] http::StatusCode StatusOf(const std::exception& ex) noexcept;

}  // namespace ignyx

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "ignyx/http-method.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/middleware.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

// Evaluates CORS requests and emits the relevant headers.
// By default any origin is allowed, credentials are disabled and GET, HEAD, POST, PUT, DELETE, PATCH are allowed.
class CorsPolicy {
 public:
  enum class ApplyStatus : std::uint8_t { NotCors, Applied, OriginDenied };

  struct PreflightResult {
    enum class Status : std::uint8_t { NotPreflight, Allowed, OriginDenied, MethodDenied, HeadersDenied };

    Status status{Status::NotPreflight};
    HttpResponse response{http::StatusCodeOK};
  };

  // Allow all origins. When credentials are enabled the request origin is mirrored.
  CorsPolicy& allowAnyOrigin();

  // Add a single origin to the allow-list (case-insensitive match).
  CorsPolicy& allowOrigin(std::string_view origin);

  CorsPolicy& allowCredentials(bool enable);

  CorsPolicy& allowMethods(http::MethodBmp methods);

  // Access-Control-Allow-Headers: *
  CorsPolicy& allowAnyRequestHeaders();

  CorsPolicy& allowRequestHeader(std::string_view header);

  CorsPolicy& exposeHeader(std::string_view header);

  // Throws std::invalid_argument if negative.
  CorsPolicy& maxAge(std::chrono::seconds maxAge);

  // Adds CORS headers to a regular (non preflight) response of a cross-origin request.
  ApplyStatus applyToResponse(const HttpRequest& request, HttpResponse& response) const;

  [[nodiscard]] PreflightResult handlePreflight(const HttpRequest& request) const;

  [[nodiscard]] static bool IsPreflightRequest(const HttpRequest& request) noexcept;

 private:
  enum class OriginMode : std::uint8_t { Any, Enumerated };

  [[nodiscard]] bool originAllowed(std::string_view origin) const noexcept;

  [[nodiscard]] bool requestHeadersAllowed(std::string_view headerList) const;

  void applyResponseHeaders(HttpResponse& response, std::string_view origin) const;

  vector<std::string> _allowedOrigins;
  vector<std::string> _allowedRequestHeaders;
  vector<std::string> _exposedHeaders;
  std::chrono::seconds _maxAge{-1};
  http::MethodBmp _allowedMethods{http::Method::GET | http::Method::HEAD | http::Method::POST | http::Method::PUT |
                                  http::Method::DELETE | http::Method::PATCH};
  OriginMode _originMode{OriginMode::Any};
  bool _allowCredentials{false};
  bool _anyRequestHeader{true};
};

// Middleware answering preflight requests (short-circuit) and decorating the other cross-origin responses.
[[nodiscard]] MiddlewareEntry CorsMiddleware(CorsPolicy policy);

// Middleware logging one line per request at info level: method, path, status and elapsed time.
[[nodiscard]] MiddlewareEntry RequestLogMiddleware();

}  // namespace ignyx

#include "ignyx/cors-policy.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/flat-hash-map.hpp"
#include "ignyx/http-constants.hpp"
#include "ignyx/http-method.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/log.hpp"
#include "ignyx/middleware.hpp"
#include "ignyx/string-equal-ignore-case.hpp"
#include "ignyx/string-trim.hpp"
#include "ignyx/timedef.hpp"

namespace ignyx {
namespace {

// Calls 'fn' with each non empty trimmed element of a comma separated list, stops when it returns false.
template <class Fn>
bool AllCsvTokens(std::string_view csv, Fn fn) {
  while (!csv.empty()) {
    const auto commaPos = std::min(csv.find(','), csv.size());
    const std::string_view token = Trim(csv.substr(0, commaPos), kOws);
    csv.remove_prefix(std::min(commaPos + 1, csv.size()));
    if (!token.empty() && !fn(token)) {
      return false;
    }
  }
  return true;
}

bool ContainsCaseInsensitive(const vector<std::string>& values, std::string_view value) {
  return std::ranges::any_of(values, [value](const std::string& elem) { return CaseInsensitiveEqual(elem, value); });
}

void AddUnique(vector<std::string>& values, std::string_view value) {
  value = Trim(value, kOws);
  if (!value.empty() && !ContainsCaseInsensitive(values, value)) {
    values.emplace_back(value);
  }
}

std::string Join(const vector<std::string>& values) {
  std::string out;
  for (const std::string& value : values) {
    if (!out.empty()) {
      out.append(", ");
    }
    out.append(value);
  }
  return out;
}

}  // namespace

CorsPolicy& CorsPolicy::allowAnyOrigin() {
  _originMode = OriginMode::Any;
  _allowedOrigins.clear();
  return *this;
}

CorsPolicy& CorsPolicy::allowOrigin(std::string_view origin) {
  _originMode = OriginMode::Enumerated;
  AddUnique(_allowedOrigins, origin);
  return *this;
}

CorsPolicy& CorsPolicy::allowCredentials(bool enable) {
  _allowCredentials = enable;
  return *this;
}

CorsPolicy& CorsPolicy::allowMethods(http::MethodBmp methods) {
  _allowedMethods = methods;
  return *this;
}

CorsPolicy& CorsPolicy::allowAnyRequestHeaders() {
  _anyRequestHeader = true;
  _allowedRequestHeaders.clear();
  return *this;
}

CorsPolicy& CorsPolicy::allowRequestHeader(std::string_view header) {
  _anyRequestHeader = false;
  AddUnique(_allowedRequestHeaders, header);
  return *this;
}

CorsPolicy& CorsPolicy::exposeHeader(std::string_view header) {
  AddUnique(_exposedHeaders, header);
  return *this;
}

CorsPolicy& CorsPolicy::maxAge(std::chrono::seconds maxAge) {
  if (maxAge < std::chrono::seconds{0}) {
    throw std::invalid_argument("maxAge must be non-negative");
  }
  _maxAge = maxAge;
  return *this;
}

CorsPolicy::ApplyStatus CorsPolicy::applyToResponse(const HttpRequest& request, HttpResponse& response) const {
  if (IsPreflightRequest(request)) {
    return ApplyStatus::NotCors;
  }
  const auto origin = request.headerValueOrEmpty(http::Origin);
  if (origin.empty()) {
    return ApplyStatus::NotCors;
  }
  if (!originAllowed(origin)) {
    return ApplyStatus::OriginDenied;
  }
  applyResponseHeaders(response, origin);
  return ApplyStatus::Applied;
}

CorsPolicy::PreflightResult CorsPolicy::handlePreflight(const HttpRequest& request) const {
  PreflightResult result;
  if (!IsPreflightRequest(request)) {
    return result;
  }

  const auto origin = request.headerValueOrEmpty(http::Origin);
  if (!originAllowed(origin)) {
    result.status = PreflightResult::Status::OriginDenied;
    result.response = HttpResponse::PlainText("Disallowed CORS origin", http::StatusCodeBadRequest);
    return result;
  }

  const auto method = http::MethodStrToOpt(request.headerValueOrEmpty(http::AccessControlRequestMethod));
  if (!method || !http::IsMethodSet(_allowedMethods, *method)) {
    result.status = PreflightResult::Status::MethodDenied;
    result.response = HttpResponse::PlainText("Disallowed CORS method", http::StatusCodeBadRequest);
    return result;
  }

  std::string_view requestedHeaders;
  if (const auto requestedHeadersOpt = request.headerValue(http::AccessControlRequestHeaders)) {
    requestedHeaders = Trim(*requestedHeadersOpt, kOws);
    if (!requestedHeaders.empty() && !requestHeadersAllowed(requestedHeaders)) {
      result.status = PreflightResult::Status::HeadersDenied;
      result.response = HttpResponse::PlainText("Disallowed CORS headers", http::StatusCodeBadRequest);
      return result;
    }
  }

  HttpResponse& response = result.response;
  response.body("OK", http::ContentTypeTextPlain);
  applyResponseHeaders(response, origin);
  response.header(http::AccessControlAllowMethods, http::MethodBmpToStr(_allowedMethods));
  if (_anyRequestHeader) {
    // '*' is not honored by browsers for credentialed requests: mirror the requested list instead.
    if (_allowCredentials && !requestedHeaders.empty()) {
      response.header(http::AccessControlAllowHeaders, requestedHeaders);
    } else {
      response.header(http::AccessControlAllowHeaders, "*");
    }
  } else if (!_allowedRequestHeaders.empty()) {
    response.header(http::AccessControlAllowHeaders, Join(_allowedRequestHeaders));
  }
  if (_maxAge.count() >= 0) {
    response.header(http::AccessControlMaxAge, std::to_string(_maxAge.count()));
  }
  result.status = PreflightResult::Status::Allowed;
  return result;
}

bool CorsPolicy::IsPreflightRequest(const HttpRequest& request) noexcept {
  if (request.method() != http::Method::OPTIONS) {
    return false;
  }
  if (request.headerValueOrEmpty(http::Origin).empty()) {
    return false;
  }
  return request.headerValue(http::AccessControlRequestMethod).has_value();
}

bool CorsPolicy::originAllowed(std::string_view origin) const noexcept {
  return _originMode == OriginMode::Any || ContainsCaseInsensitive(_allowedOrigins, origin);
}

bool CorsPolicy::requestHeadersAllowed(std::string_view headerList) const {
  return _anyRequestHeader || AllCsvTokens(headerList, [this](std::string_view token) {
           return ContainsCaseInsensitive(_allowedRequestHeaders, token);
         });
}

void CorsPolicy::applyResponseHeaders(HttpResponse& response, std::string_view origin) const {
  // A wildcard cannot be combined with credentials: the origin is echoed and caches must key on it.
  if (_originMode == OriginMode::Any && !_allowCredentials) {
    response.header(http::AccessControlAllowOrigin, "*");
  } else {
    response.header(http::AccessControlAllowOrigin, origin);
    const auto notOrigin = [](std::string_view token) { return !CaseInsensitiveEqual(token, http::Origin); };
    if (AllCsvTokens(response.headerValue(http::Vary).value_or(std::string_view{}), notOrigin)) {
      response.addHeader(http::Vary, http::Origin);
    }
  }
  if (_allowCredentials) {
    response.header(http::AccessControlAllowCredentials, "true");
  }
  if (!_exposedHeaders.empty()) {
    response.header(http::AccessControlExposeHeaders, Join(_exposedHeaders));
  }
}

MiddlewareEntry CorsMiddleware(CorsPolicy policy) {
  auto sharedPolicy = std::make_shared<const CorsPolicy>(std::move(policy));
  MiddlewareEntry entry;
  entry.name = "cors";
  entry.before = [sharedPolicy](HttpRequest& request) {
    if (!CorsPolicy::IsPreflightRequest(request)) {
      return MiddlewareResult::Continue();
    }
    return MiddlewareResult::ShortCircuit(std::move(sharedPolicy->handlePreflight(request).response));
  };
  entry.after = [sharedPolicy](const HttpRequest& request, HttpResponse& response) {
    if (sharedPolicy->applyToResponse(request, response) == CorsPolicy::ApplyStatus::OriginDenied) {
      log::debug("CORS origin '{}' denied for {}", request.headerValueOrEmpty(http::Origin), request.path());
    }
  };
  return entry;
}

MiddlewareEntry RequestLogMiddleware() {
  // Start times keyed by request address: both hooks of a request run with the call-lock held, and a request
  // object lives until its response is produced.
  auto startTimes = std::make_shared<flat_hash_map<const HttpRequest*, SteadyTimePoint>>();
  MiddlewareEntry entry;
  entry.name = "request-log";
  entry.before = [startTimes](HttpRequest& request) {
    (*startTimes)[&request] = SteadyClock::now();
    return MiddlewareResult::Continue();
  };
  entry.after = [startTimes](const HttpRequest& request, HttpResponse& response) {
    auto it = startTimes->find(&request);
    if (it == startTimes->end()) {
      return;
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(SteadyClock::now() - it->second);
    startTimes->erase(it);
    log::info("{} {} -> {} ({} us)", http::MethodToStr(request.method()), request.path(), response.status(),
              elapsed.count());
  };
  return entry;
}

}  // namespace ignyx

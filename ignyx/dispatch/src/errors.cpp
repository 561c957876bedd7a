#include "ignyx/errors.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

#include "ignyx/http-constants.hpp"
#include "ignyx/http-method.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/json.hpp"

namespace ignyx {

namespace {

std::string JoinCycle(const vector<std::string>& cycle) {
  std::string out;
  for (const std::string& name : cycle) {
    if (!out.empty()) {
      out.append(" -> ");
    }
    out.append(name);
  }
  return out;
}

}  // namespace

HttpException::HttpException(http::StatusCode status, std::string detail, HeaderMap headers)
    : std::runtime_error(detail.empty() ? std::string(http::ReasonPhraseFor(status)) : detail),
      _status(status),
      _detail(detail.empty() ? std::string(http::ReasonPhraseFor(status)) : std::move(detail)),
      _headers(std::move(headers)) {}

MethodNotAllowed::MethodNotAllowed(http::MethodBmp allowedMethods)
    : HttpException(http::StatusCodeMethodNotAllowed, "Method Not Allowed",
                    HeaderMap().append(http::Allow, http::MethodBmpToStr(allowedMethods))),
      _allowedMethods(allowedMethods) {}

Json FieldError::toJson() const {
  Json locJson = JsonArray();
  for (const LocPart& part : loc) {
    if (const auto* name = std::get_if<std::string>(&part)) {
      locJson.get_array().emplace_back(*name);
    } else {
      locJson.get_array().emplace_back(static_cast<double>(std::get<int64_t>(part)));
    }
  }
  Json entry = JsonObject();
  entry["type"] = type;
  entry["loc"] = std::move(locJson);
  entry["msg"] = msg;
  entry["input"] = input;
  return entry;
}

ValidationError::ValidationError(vector<FieldError> errors)
    : std::runtime_error(std::to_string(errors.size()) + " validation error(s)"), _errors(std::move(errors)) {}

Json ValidationError::toJson() const {
  Json detail = JsonArray();
  for (const FieldError& error : _errors) {
    detail.get_array().push_back(error.toJson());
  }
  Json body = JsonObject();
  body["detail"] = std::move(detail);
  return body;
}

ConnectionClosed::ConnectionClosed(uint16_t closeCode, std::string reason)
    : std::runtime_error("WebSocket connection closed with code " + std::to_string(closeCode)),
      _closeCode(closeCode),
      _reason(std::move(reason)) {}

CyclicDependency::CyclicDependency(vector<std::string> cycle)
    : std::logic_error("Cyclic dependency detected: " + JoinCycle(cycle)), _cycle(std::move(cycle)) {}

http::StatusCode StatusOf(const std::exception& ex) noexcept {
  if (const auto* httpException = dynamic_cast<const HttpException*>(&ex)) {
    return httpException->status();
  }
  if (dynamic_cast<const ValidationError*>(&ex) != nullptr) {
    return http::StatusCodeUnprocessableEntity;
  }
  if (dynamic_cast<const LockTimeout*>(&ex) != nullptr) {
    return http::StatusCodeServiceUnavailable;
  }
  return http::StatusCodeInternalServerError;
}

}  // namespace ignyx

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "ignyx/http-headers.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/json.hpp"

namespace ignyx {

// Already serialized JSON document.
struct JsonText {
  std::string text;
};

// Value returned by a handler, converted into an HttpResponse by Marshal().
// It is either nothing (rendered as JSON null), a JSON value, a text, a serialized JSON document or a complete
// response, optionally overridden by a status and extra headers (tuple form).
class HandlerResult {
 public:
  using Body = std::variant<std::monostate, Json, std::string, JsonText, HttpResponse>;

  HandlerResult() noexcept = default;

  HandlerResult(Json value) : _body(std::move(value)) {}

  HandlerResult(std::string text) : _body(std::move(text)) {}

  HandlerResult(std::string_view text) : _body(std::string(text)) {}

  HandlerResult(const char* text) : _body(std::string(text)) {}

  HandlerResult(JsonText json) : _body(std::move(json)) {}

  HandlerResult(HttpResponse response) : _body(std::move(response)) {}

  // Tuple form: body with an explicit status and additional headers. Headers given here win over the ones
  // derived from the body.
  HandlerResult(HandlerResult body, http::StatusCode status, HeaderMap headers = {})
      : _body(std::move(body._body)), _status(status), _headers(std::move(headers)) {}

  // Serializes any glaze-reflectable value.
  template <class T>
  static HandlerResult Serialize(const T& value) {
    return HandlerResult(JsonText{SerializeToJson(value)});
  }

  [[nodiscard]] const Body& body() const noexcept { return _body; }

  [[nodiscard]] Body&& takeBody() && noexcept { return std::move(_body); }

  [[nodiscard]] std::optional<http::StatusCode> status() const noexcept { return _status; }

  [[nodiscard]] const HeaderMap& headers() const noexcept { return _headers; }

  [[nodiscard]] bool isNone() const noexcept { return std::holds_alternative<std::monostate>(_body); }

 private:
  Body _body;
  std::optional<http::StatusCode> _status;
  HeaderMap _headers;
};

}  // namespace ignyx

#include "ignyx/marshal.hpp"

#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "ignyx/cookie.hpp"
#include "ignyx/handler-result.hpp"
#include "ignyx/http-constants.hpp"
#include "ignyx/http-headers.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/json.hpp"
#include "ignyx/string-trim.hpp"

namespace ignyx {

namespace {

bool LooksLikeMarkup(std::string_view text) noexcept {
  text = TrimLeft(text);
  return !text.empty() && text.front() == '<';
}

}  // namespace

HttpResponse Marshal(HandlerResult result, const HeaderMap& extraHeaders, std::span<const Cookie> cookies) {
  const auto status = result.status();
  HeaderMap tupleHeaders = result.headers();
  HttpResponse response = std::visit(
      [](auto&& body) -> HttpResponse {
        using T = std::decay_t<decltype(body)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return HttpResponse(http::StatusCodeOK, "null", http::ContentTypeApplicationJson);
        } else if constexpr (std::is_same_v<T, Json>) {
          return HttpResponse(http::StatusCodeOK, DumpJson(body), http::ContentTypeApplicationJson);
        } else if constexpr (std::is_same_v<T, JsonText>) {
          return HttpResponse(http::StatusCodeOK, std::move(body.text), http::ContentTypeApplicationJson);
        } else if constexpr (std::is_same_v<T, std::string>) {
          if (LooksLikeMarkup(body)) {
            return HttpResponse::Html(std::move(body));
          }
          return HttpResponse::PlainText(std::move(body));
        } else {
          return std::move(body);
        }
      },
      std::move(result).takeBody());

  if (status) {
    response.status(*status);
  }
  for (const auto& [name, value] : extraHeaders.entries()) {
    if (!response.headers().contains(name)) {
      response.addHeader(name, value);
    }
  }
  for (const auto& [name, value] : tupleHeaders.entries()) {
    response.header(name, value);
  }
  for (const Cookie& cookie : cookies) {
    response.setCookie(cookie);
  }
  return response;
}

HttpResponse DetailResponse(http::StatusCode status, const Json& detail) {
  Json body = JsonObject();
  body["detail"] = detail;
  return HttpResponse(status, DumpJson(body), http::ContentTypeApplicationJson);
}

}  // namespace ignyx

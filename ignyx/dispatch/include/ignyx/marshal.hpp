#pragma once

#include <span>

#include "ignyx/cookie.hpp"
#include "ignyx/handler-result.hpp"
#include "ignyx/http-headers.hpp"
#include "ignyx/http-response.hpp"

namespace ignyx {

// Converts a handler result into the response sent to the client:
//   - none and JSON values are serialized as application/json,
//   - text starting with '<' (leading whitespace ignored) is sent as text/html, other text as text/plain,
//   - an HttpResponse is used verbatim.
// 'extraHeaders' are added when the response does not already define them, then the tuple form headers are set
// (they win on conflict) and 'cookies' are appended as Set-Cookie directives.
[[nodiscard]] HttpResponse Marshal(HandlerResult result, const HeaderMap& extraHeaders = {},
                                   std::span<const Cookie> cookies = {});

// Response with body {"detail": detail}.
[[nodiscard]] HttpResponse DetailResponse(http::StatusCode status, const Json& detail);

}  // namespace ignyx

#pragma once

#include <cstdint>
#include <string_view>

namespace ignyx::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeSwitchingProtocols = 101;

inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeCreated = 201;
inline constexpr StatusCode StatusCodeAccepted = 202;
inline constexpr StatusCode StatusCodeNoContent = 204;

inline constexpr StatusCode StatusCodeMovedPermanently = 301;
inline constexpr StatusCode StatusCodeFound = 302;
inline constexpr StatusCode StatusCodeSeeOther = 303;
inline constexpr StatusCode StatusCodeNotModified = 304;
inline constexpr StatusCode StatusCodeTemporaryRedirect = 307;
inline constexpr StatusCode StatusCodePermanentRedirect = 308;

inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeUnauthorized = 401;
inline constexpr StatusCode StatusCodeForbidden = 403;
inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodeMethodNotAllowed = 405;
inline constexpr StatusCode StatusCodeRequestTimeout = 408;
inline constexpr StatusCode StatusCodeConflict = 409;
inline constexpr StatusCode StatusCodeLengthRequired = 411;
inline constexpr StatusCode StatusCodePayloadTooLarge = 413;
inline constexpr StatusCode StatusCodeURITooLong = 414;
inline constexpr StatusCode StatusCodeUnsupportedMediaType = 415;
inline constexpr StatusCode StatusCodeImATeapot = 418;
inline constexpr StatusCode StatusCodeUnprocessableEntity = 422;
inline constexpr StatusCode StatusCodeUpgradeRequired = 426;
inline constexpr StatusCode StatusCodeTooManyRequests = 429;
inline constexpr StatusCode StatusCodeRequestHeaderFieldsTooLarge = 431;

inline constexpr StatusCode StatusCodeInternalServerError = 500;
inline constexpr StatusCode StatusCodeNotImplemented = 501;
inline constexpr StatusCode StatusCodeBadGateway = 502;
inline constexpr StatusCode StatusCodeServiceUnavailable = 503;
inline constexpr StatusCode StatusCodeGatewayTimeout = 504;
inline constexpr StatusCode StatusCodeHTTPVersionNotSupported = 505;

// Returns an empty string_view for unknown codes.
[[nodiscard]] std::string_view ReasonPhraseFor(StatusCode status) noexcept;

}  // namespace ignyx::http

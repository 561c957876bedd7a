#pragma once

#include <string_view>

namespace ignyx::http {

// Header field names are case-insensitive (RFC 9110). They are stored here in the canonical
// form used for emission. Token values are lowercase to keep case-insensitive comparisons cheap.

inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentDisposition = "Content-Disposition";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Cookie = "Cookie";
inline constexpr std::string_view Date = "Date";
inline constexpr std::string_view Expect = "Expect";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view Location = "Location";
inline constexpr std::string_view Origin = "Origin";
inline constexpr std::string_view Server = "Server";
inline constexpr std::string_view SetCookie = "Set-Cookie";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view Upgrade = "Upgrade";
inline constexpr std::string_view Vary = "Vary";

inline constexpr std::string_view AccessControlAllowOrigin = "Access-Control-Allow-Origin";
inline constexpr std::string_view AccessControlAllowMethods = "Access-Control-Allow-Methods";
inline constexpr std::string_view AccessControlAllowHeaders = "Access-Control-Allow-Headers";
inline constexpr std::string_view AccessControlAllowCredentials = "Access-Control-Allow-Credentials";
inline constexpr std::string_view AccessControlExposeHeaders = "Access-Control-Expose-Headers";
inline constexpr std::string_view AccessControlMaxAge = "Access-Control-Max-Age";
inline constexpr std::string_view AccessControlRequestMethod = "Access-Control-Request-Method";
inline constexpr std::string_view AccessControlRequestHeaders = "Access-Control-Request-Headers";

inline constexpr std::string_view SecWebSocketKey = "Sec-WebSocket-Key";
inline constexpr std::string_view SecWebSocketVersion = "Sec-WebSocket-Version";
inline constexpr std::string_view SecWebSocketAccept = "Sec-WebSocket-Accept";
inline constexpr std::string_view SecWebSocketProtocol = "Sec-WebSocket-Protocol";

inline constexpr std::string_view chunked = "chunked";
inline constexpr std::string_view close = "close";
inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view upgrade = "upgrade";
inline constexpr std::string_view websocket = "websocket";
inline constexpr std::string_view h100_continue = "100-continue";

inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

inline constexpr std::string_view ContentTypeApplicationJson = "application/json";
inline constexpr std::string_view ContentTypeTextPlain = "text/plain; charset=utf-8";
inline constexpr std::string_view ContentTypeTextHtml = "text/html; charset=utf-8";
inline constexpr std::string_view ContentTypeOctetStream = "application/octet-stream";
inline constexpr std::string_view ContentTypeFormUrlEncoded = "application/x-www-form-urlencoded";
inline constexpr std::string_view ContentTypeMultipartFormData = "multipart/form-data";

}  // namespace ignyx::http

#include <string_view>

#include "ignyx/http-status-code.hpp"

namespace ignyx::http {

std::string_view ReasonPhraseFor(StatusCode status) noexcept {
  switch (status) {
    case StatusCodeSwitchingProtocols:
      return "Switching Protocols";
    case StatusCodeOK:
      return "OK";
    case StatusCodeCreated:
      return "Created";
    case StatusCodeAccepted:
      return "Accepted";
    case StatusCodeNoContent:
      return "No Content";
    case StatusCodeMovedPermanently:
      return "Moved Permanently";
    case StatusCodeFound:
      return "Found";
    case StatusCodeSeeOther:
      return "See Other";
    case StatusCodeNotModified:
      return "Not Modified";
    case StatusCodeTemporaryRedirect:
      return "Temporary Redirect";
    case StatusCodePermanentRedirect:
      return "Permanent Redirect";
    case StatusCodeBadRequest:
      return "Bad Request";
    case StatusCodeUnauthorized:
      return "Unauthorized";
    case StatusCodeForbidden:
      return "Forbidden";
    case StatusCodeNotFound:
      return "Not Found";
    case StatusCodeMethodNotAllowed:
      return "Method Not Allowed";
    case StatusCodeRequestTimeout:
      return "Request Timeout";
    case StatusCodeConflict:
      return "Conflict";
    case StatusCodeLengthRequired:
      return "Length Required";
    case StatusCodePayloadTooLarge:
      return "Payload Too Large";
    case StatusCodeURITooLong:
      return "URI Too Long";
    case StatusCodeUnsupportedMediaType:
      return "Unsupported Media Type";
    case StatusCodeImATeapot:
      return "I'm a teapot";
    case StatusCodeUnprocessableEntity:
      return "Unprocessable Entity";
    case StatusCodeUpgradeRequired:
      return "Upgrade Required";
    case StatusCodeTooManyRequests:
      return "Too Many Requests";
    case StatusCodeRequestHeaderFieldsTooLarge:
      return "Request Header Fields Too Large";
    case StatusCodeInternalServerError:
      return "Internal Server Error";
    case StatusCodeNotImplemented:
      return "Not Implemented";
    case StatusCodeBadGateway:
      return "Bad Gateway";
    case StatusCodeServiceUnavailable:
      return "Service Unavailable";
    case StatusCodeGatewayTimeout:
      return "Gateway Timeout";
    case StatusCodeHTTPVersionNotSupported:
      return "HTTP Version Not Supported";
    default:
      return {};
  }
}

}  // namespace ignyx::http

#include "ignyx/http-response.hpp"

#include <chrono>
#include <format>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/cookie.hpp"
#include "ignyx/http-constants.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/string-equal-ignore-case.hpp"
#include "ignyx/timedef.hpp"

namespace ignyx {

namespace {

// Headers computed at serialization time, ignored if set by the user.
// Connection is kept for protocol switches, which must carry 'Connection: Upgrade'.
bool IsReservedHeader(std::string_view name, http::StatusCode status) {
  if (CaseInsensitiveEqual(name, http::Connection)) {
    return status != http::StatusCodeSwitchingProtocols;
  }
  return CaseInsensitiveEqual(name, http::ContentLength) || CaseInsensitiveEqual(name, http::TransferEncoding) ||
         CaseInsensitiveEqual(name, http::Date);
}

bool StatusHasNoBody(http::StatusCode status) {
  return status < 200 || status == http::StatusCodeNoContent || status == http::StatusCodeNotModified;
}

}  // namespace

HttpResponse::HttpResponse(http::StatusCode status, std::string body, std::string_view contentType)
    : _status(status) {
  this->body(std::move(body), contentType);
}

HttpResponse HttpResponse::PlainText(std::string text, http::StatusCode status) {
  return HttpResponse(status, std::move(text), http::ContentTypeTextPlain);
}

HttpResponse HttpResponse::Html(std::string html, http::StatusCode status) {
  return HttpResponse(status, std::move(html), http::ContentTypeTextHtml);
}

HttpResponse HttpResponse::Redirect(std::string_view location, http::StatusCode status) {
  HttpResponse response(status);
  response.header(http::Location, location);
  return response;
}

HttpResponse HttpResponse::File(std::string content, std::string_view filename, std::string_view contentType) {
  HttpResponse response(http::StatusCodeOK, std::move(content), contentType);
  response.header(http::ContentDisposition, std::format("attachment; filename=\"{}\"", filename));
  return response;
}

HttpResponse& HttpResponse::body(std::string body, std::string_view contentType) {
  _body = std::move(body);
  _chunkSource = nullptr;
  if (!contentType.empty()) {
    _headers.set(http::ContentType, contentType);
  }
  return *this;
}

HttpResponse& HttpResponse::streamingBody(ChunkSource source, std::string_view contentType) {
  _body.clear();
  _chunkSource = std::move(source);
  if (!contentType.empty()) {
    _headers.set(http::ContentType, contentType);
  }
  return *this;
}

HttpResponse& HttpResponse::setCookie(Cookie cookie) {
  _cookies.push_back(std::move(cookie));
  return *this;
}

HttpResponse& HttpResponse::deleteCookie(std::string name, std::string path) {
  return setCookie(Cookie::Deletion(std::move(name), std::move(path)));
}

std::string HttpResponse::serializeHead(const WireOptions& options) const {
  std::string_view reason = http::ReasonPhraseFor(_status);
  std::string out = std::format("{} {} {}\r\n", http::HTTP11Sv, _status, reason.empty() ? "Unknown" : reason);

  const auto now = std::chrono::floor<std::chrono::seconds>(SysClock::now());
  out.append(std::format("{}: {:%a, %d %b %Y %H:%M:%S} GMT\r\n", http::Date, now));
  if (!options.serverName.empty() && !_headers.contains(http::Server)) {
    out.append(std::format("{}: {}\r\n", http::Server, options.serverName));
  }
  for (const HeaderMap::Entry& entry : _headers.entries()) {
    if (!IsReservedHeader(entry.name, _status)) {
      out.append(std::format("{}: {}\r\n", entry.name, entry.value));
    }
  }
  for (const Cookie& cookie : _cookies) {
    out.append(std::format("{}: {}\r\n", http::SetCookie, cookie.toHeaderValue()));
  }
  if (isStreaming()) {
    out.append(std::format("{}: {}\r\n", http::TransferEncoding, http::chunked));
  } else if (!StatusHasNoBody(_status)) {
    out.append(std::format("{}: {}\r\n", http::ContentLength, _body.size()));
  }
  if (_status != http::StatusCodeSwitchingProtocols) {
    out.append(std::format("{}: {}\r\n", http::Connection, options.keepAlive ? http::keepalive : http::close));
  }
  out.append(http::CRLF);
  return out;
}

std::string HttpResponse::serialize(const WireOptions& options) const {
  std::string out = serializeHead(options);
  if (!options.headRequest && !StatusHasNoBody(_status)) {
    out.append(_body);
  }
  return out;
}

std::string HttpResponse::EncodeChunk(std::string_view chunk) {
  return std::format("{:x}\r\n{}\r\n", chunk.size(), chunk);
}

}  // namespace ignyx

#pragma once

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "ignyx/cookie.hpp"
#include "ignyx/http-headers.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

// An HTTP response. The body is either a byte string or a streaming source pulled chunk by chunk
// (sent with chunked transfer coding).
class HttpResponse {
 public:
  // Produces the next body chunk, or std::nullopt once the body is complete.
  using ChunkSource = std::function<std::optional<std::string>()>;

  struct WireOptions {
    bool headRequest{false};
    bool keepAlive{true};
    std::string_view serverName;
  };

  explicit HttpResponse(http::StatusCode status = http::StatusCodeOK) noexcept : _status(status) {}

  HttpResponse(http::StatusCode status, std::string body, std::string_view contentType);

  static HttpResponse PlainText(std::string text, http::StatusCode status = http::StatusCodeOK);

  static HttpResponse Html(std::string html, http::StatusCode status = http::StatusCodeOK);

  // Redirect with a Location header, 307 by default.
  static HttpResponse Redirect(std::string_view location, http::StatusCode status = http::StatusCodeTemporaryRedirect);

  // Attachment download: content-disposition carries 'filename'.
  static HttpResponse File(std::string content, std::string_view filename,
                           std::string_view contentType = "application/octet-stream");

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  HttpResponse& status(http::StatusCode status) noexcept {
    _status = status;
    return *this;
  }

  [[nodiscard]] HeaderMap& headers() noexcept { return _headers; }
  [[nodiscard]] const HeaderMap& headers() const noexcept { return _headers; }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return _headers.get(name);
  }

  // Sets (replaces) a header.
  HttpResponse& header(std::string_view name, std::string_view value) {
    _headers.set(name, value);
    return *this;
  }

  // Appends a header, keeping existing ones with the same name.
  HttpResponse& addHeader(std::string_view name, std::string_view value) {
    _headers.append(name, value);
    return *this;
  }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  HttpResponse& body(std::string body, std::string_view contentType);

  HttpResponse& streamingBody(ChunkSource source, std::string_view contentType);

  [[nodiscard]] bool isStreaming() const noexcept { return static_cast<bool>(_chunkSource); }

  // Moves the streaming source out of the response.
  [[nodiscard]] ChunkSource takeChunkSource() noexcept { return std::move(_chunkSource); }

  HttpResponse& setCookie(Cookie cookie);

  HttpResponse& deleteCookie(std::string name, std::string path = "/");

  [[nodiscard]] std::span<const Cookie> cookies() const noexcept { return {_cookies.data(), _cookies.size()}; }

  // Status line and header block, including the final empty line. Adds Content-Length (or
  // Transfer-Encoding: chunked for streaming bodies), Date, Server, Connection and one Set-Cookie per cookie.
  [[nodiscard]] std::string serializeHead(const WireOptions& options) const;

  // Head followed by the body (omitted for HEAD requests). Not valid for streaming bodies.
  [[nodiscard]] std::string serialize(const WireOptions& options) const;

  // Frames a chunk of a streaming body. An empty chunk encodes the terminating chunk.
  static std::string EncodeChunk(std::string_view chunk);

 private:
  http::StatusCode _status;
  HeaderMap _headers;
  std::string _body;
  ChunkSource _chunkSource;
  vector<Cookie> _cookies;
};

}  // namespace ignyx

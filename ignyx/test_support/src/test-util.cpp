#include "ignyx/test-util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "ignyx/string-equal-ignore-case.hpp"
#include "ignyx/websocket-frame.hpp"

namespace ignyx::test {

namespace {

constexpr websocket::MaskingKey kClientMask{std::byte{0x12}, std::byte{0x34}, std::byte{0x56}, std::byte{0x78}};

// Waits for the socket to be readable. Returns false on timeout.
bool waitReadable(int fd, std::chrono::milliseconds timeout) {
  pollfd pfd{fd, POLLIN, 0};
  return ::poll(&pfd, 1, static_cast<int>(timeout.count())) > 0;
}

std::optional<std::string_view> findHeader(std::string_view head, std::string_view name) {
  std::size_t pos = head.find("\r\n");
  while (pos != std::string_view::npos && pos + 2 < head.size()) {
    const std::size_t lineBeg = pos + 2;
    const std::size_t lineEnd = std::min(head.find("\r\n", lineBeg), head.size());
    const std::string_view line = head.substr(lineBeg, lineEnd - lineBeg);
    const std::size_t colon = line.find(':');
    if (colon != std::string_view::npos && CaseInsensitiveEqual(line.substr(0, colon), name)) {
      std::string_view value = line.substr(colon + 1);
      while (!value.empty() && value.front() == ' ') {
        value.remove_prefix(1);
      }
      return value;
    }
    pos = lineEnd == head.size() ? std::string_view::npos : lineEnd;
  }
  return std::nullopt;
}

// Size of the complete response at the start of 'raw', or 0 if incomplete.
std::size_t completeResponseSize(std::string_view raw) {
  const std::size_t headerEnd = raw.find("\r\n\r\n");
  if (headerEnd == std::string_view::npos) {
    return 0;
  }
  const std::size_t bodyStart = headerEnd + 4;
  const std::string_view head = raw.substr(0, headerEnd);
  if (head.starts_with("HTTP/1.1 1")) {
    return bodyStart;
  }
  if (auto te = findHeader(head, "Transfer-Encoding"); te && CaseInsensitiveEqual(*te, "chunked")) {
    std::size_t pos = bodyStart;
    while (true) {
      const std::size_t lineEnd = raw.find("\r\n", pos);
      if (lineEnd == std::string_view::npos) {
        return 0;
      }
      std::size_t chunkSize = 0;
      std::from_chars(raw.data() + pos, raw.data() + lineEnd, chunkSize, 16);
      const std::size_t next = lineEnd + 2 + chunkSize + 2;
      if (next > raw.size()) {
        return 0;
      }
      if (chunkSize == 0) {
        return next;
      }
      pos = next;
    }
  }
  std::size_t contentLength = 0;
  if (auto cl = findHeader(head, "Content-Length")) {
    std::from_chars(cl->data(), cl->data() + cl->size(), contentLength);
  }
  return raw.size() >= bodyStart + contentLength ? bodyStart + contentLength : 0;
}

}  // namespace

ClientConnection::ClientConnection(uint16_t port, std::chrono::milliseconds timeout) : _socket(Socket::Type::Stream) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (::connect(_socket.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    if (std::chrono::steady_clock::now() >= deadline) {
      throw std::system_error(errno, std::generic_category(), "connect");
    }
    std::this_thread::sleep_for(5ms);
  }
}

bool sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout) {
  const auto deadline = std::chrono::steady_clock::now() + totalTimeout;
  while (!data.empty()) {
    const auto sent = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (sent <= 0) {
      if (std::chrono::steady_clock::now() >= deadline) {
        return false;
      }
      std::this_thread::sleep_for(1ms);
      continue;
    }
    data.remove_prefix(static_cast<std::size_t>(sent));
  }
  return true;
}

std::string recvResponse(int fd, std::chrono::milliseconds totalTimeout, std::string* leftover) {
  std::string out = leftover != nullptr ? std::exchange(*leftover, {}) : std::string{};
  const auto deadline = std::chrono::steady_clock::now() + totalTimeout;
  char buf[8192];
  while (true) {
    if (const std::size_t size = completeResponseSize(out); size != 0) {
      if (leftover != nullptr) {
        *leftover = out.substr(size);
      }
      out.resize(size);
      return out;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline ||
        !waitReadable(fd, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now))) {
      return out;
    }
    const auto nbRead = ::recv(fd, buf, sizeof(buf), 0);
    if (nbRead <= 0) {
      return out;
    }
    out.append(buf, static_cast<std::size_t>(nbRead));
  }
}

std::string recvUntilClosed(int fd, std::chrono::milliseconds totalTimeout) {
  std::string out;
  const auto deadline = std::chrono::steady_clock::now() + totalTimeout;
  char buf[8192];
  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline ||
        !waitReadable(fd, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now))) {
      return out;
    }
    const auto nbRead = ::recv(fd, buf, sizeof(buf), 0);
    if (nbRead <= 0) {
      return out;
    }
    out.append(buf, static_cast<std::size_t>(nbRead));
  }
}

bool waitForPeerClose(int fd, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char buf[1024];
  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline ||
        !waitReadable(fd, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now))) {
      return false;
    }
    const auto nbRead = ::recv(fd, buf, sizeof(buf), 0);
    if (nbRead == 0 || (nbRead < 0 && errno == ECONNRESET)) {
      return true;
    }
  }
}

std::string buildRequest(const RequestOptions& opt) {
  std::string req = opt.method + ' ' + opt.target + " HTTP/1.1\r\nHost: localhost\r\n";
  if (!opt.connection.empty()) {
    req += "Connection: " + opt.connection + "\r\n";
  }
  for (const auto& [name, value] : opt.headers) {
    req += name + ": " + value + "\r\n";
  }
  if (!opt.body.empty()) {
    req += "Content-Length: " + std::to_string(opt.body.size()) + "\r\n";
  }
  req += "\r\n";
  req += opt.body;
  return req;
}

std::optional<ParsedResponse> parseResponse(std::string_view raw) {
  const std::size_t headerEnd = raw.find("\r\n\r\n");
  if (headerEnd == std::string_view::npos || !raw.starts_with("HTTP/1.1 ") || raw.size() < 12) {
    return std::nullopt;
  }
  ParsedResponse parsed;
  const std::string_view statusLine = raw.substr(0, raw.find("\r\n"));
  std::from_chars(statusLine.data() + 9, statusLine.data() + 12, parsed.statusCode);
  if (statusLine.size() > 13) {
    parsed.reason = statusLine.substr(13);
  }

  std::size_t pos = statusLine.size() + 2;
  while (pos < headerEnd) {
    const std::size_t lineEnd = raw.find("\r\n", pos);
    const std::string_view line = raw.substr(pos, lineEnd - pos);
    const std::size_t colon = line.find(':');
    if (colon != std::string_view::npos) {
      std::string_view value = line.substr(colon + 1);
      while (!value.empty() && value.front() == ' ') {
        value.remove_prefix(1);
      }
      parsed.headers.emplace(std::string(line.substr(0, colon)), std::string(value));
    }
    pos = lineEnd + 2;
  }

  std::string_view body = raw.substr(headerEnd + 4);
  auto te = parsed.headers.find("Transfer-Encoding");
  parsed.chunked = te != parsed.headers.end() && te->second == "chunked";
  if (!parsed.chunked) {
    parsed.body = body;
    return parsed;
  }
  while (!body.empty()) {
    const std::size_t lineEnd = body.find("\r\n");
    if (lineEnd == std::string_view::npos) {
      return std::nullopt;
    }
    std::size_t chunkSize = 0;
    std::from_chars(body.data(), body.data() + lineEnd, chunkSize, 16);
    if (chunkSize == 0 || body.size() < lineEnd + 2 + chunkSize + 2) {
      break;
    }
    parsed.body.append(body.substr(lineEnd + 2, chunkSize));
    body.remove_prefix(lineEnd + 2 + chunkSize + 2);
  }
  return parsed;
}

ParsedResponse requestOrThrow(uint16_t port, const RequestOptions& opt) {
  ClientConnection cnx(port);
  if (!sendAll(cnx.fd(), buildRequest(opt))) {
    throw std::runtime_error("Unable to send request");
  }
  auto parsed = parseResponse(recvResponse(cnx.fd()));
  if (!parsed) {
    throw std::runtime_error("Invalid or missing response");
  }
  return std::move(*parsed);
}

WebSocketTestClient::WebSocketTestClient(uint16_t port, std::string_view target,
                                         std::vector<std::string> subprotocols)
    : _connection(port) {
  RequestOptions opt;
  opt.target = target;
  opt.connection = "Upgrade";
  opt.headers = {{"Upgrade", "websocket"},
                 {"Sec-WebSocket-Key", "dGhlIHNhbXBsZSBub25jZQ=="},
                 {"Sec-WebSocket-Version", "13"}};
  if (!subprotocols.empty()) {
    std::string offered;
    for (const auto& protocol : subprotocols) {
      if (!offered.empty()) {
        offered += ", ";
      }
      offered += protocol;
    }
    opt.headers.emplace_back("Sec-WebSocket-Protocol", std::move(offered));
  }
  if (!sendAll(fd(), buildRequest(opt))) {
    throw std::runtime_error("Unable to send the WebSocket handshake");
  }
  _handshakeResponse = recvResponse(fd(), 2000ms, &_buffer);
  if (!_handshakeResponse.starts_with("HTTP/1.1 101")) {
    throw std::runtime_error("WebSocket handshake refused: " + _handshakeResponse);
  }
}

void WebSocketTestClient::sendFrame(websocket::Opcode opcode, std::string_view payload, bool fin) const {
  std::string frame;
  websocket::BuildFrame(frame, opcode, payload, fin, true, kClientMask);
  if (!sendAll(fd(), frame)) {
    throw std::runtime_error("Unable to send a WebSocket frame");
  }
}

void WebSocketTestClient::sendText(std::string_view text) const { sendFrame(websocket::Opcode::Text, text); }

void WebSocketTestClient::sendBinary(std::string_view data) const { sendFrame(websocket::Opcode::Binary, data); }

void WebSocketTestClient::sendClose(uint16_t code, std::string_view reason) const {
  std::string frame;
  websocket::BuildCloseFrame(frame, static_cast<websocket::CloseCode>(code), reason, true, kClientMask);
  if (!sendAll(fd(), frame)) {
    throw std::runtime_error("Unable to send a WebSocket close frame");
  }
}

std::optional<ReceivedFrame> WebSocketTestClient::receive(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char buf[8192];
  while (true) {
    const auto result = websocket::ParseFrame(std::as_bytes(std::span(_buffer.data(), _buffer.size())), 0, false);
    if (result.status == websocket::FrameParseResult::Status::Complete) {
      ReceivedFrame frame{result.header.opcode, result.header.fin,
                          std::string(reinterpret_cast<const char*>(result.payload.data()), result.payload.size())};
      _buffer.erase(0, result.bytesConsumed);
      return frame;
    }
    if (result.status != websocket::FrameParseResult::Status::Incomplete) {
      throw std::runtime_error("Invalid frame from the server");
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline ||
        !waitReadable(fd(), std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now))) {
      return std::nullopt;
    }
    const auto nbRead = ::recv(fd(), buf, sizeof(buf), 0);
    if (nbRead <= 0) {
      return std::nullopt;
    }
    _buffer.append(buf, static_cast<std::size_t>(nbRead));
  }
}

}  // namespace ignyx::test

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ignyx/http-status-code.hpp"
#include "ignyx/socket.hpp"
#include "ignyx/websocket-constants.hpp"

namespace ignyx::test {
using namespace std::chrono_literals;

// Blocking loopback client connection.
class ClientConnection {
 public:
  ClientConnection() noexcept = default;

  // Throws std::system_error if the connection cannot be established before 'timeout'.
  explicit ClientConnection(uint16_t port, std::chrono::milliseconds timeout = 1000ms);

  [[nodiscard]] int fd() const noexcept { return _socket.fd(); }

 private:
  Socket _socket;
};

// Minimal parsed HTTP response for test assertions.
struct ParsedResponse {
  http::StatusCode statusCode{0};
  bool chunked{false};
  std::string reason;
  std::map<std::string, std::string> headers;  // keys as sent by the server
  std::string body;                            // de-chunked
};

struct RequestOptions {
  std::string method{"GET"};
  std::string target{"/"};
  std::string connection{"close"};
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;
};

bool sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout = 500ms);

// Reads until one complete HTTP response (Content-Length or chunked framing) is received, the peer closes or
// 'totalTimeout' elapses. Bytes following the response are left in 'leftover' when given.
std::string recvResponse(int fd, std::chrono::milliseconds totalTimeout = 2000ms, std::string* leftover = nullptr);

// Reads until the peer closes or 'totalTimeout' elapses.
std::string recvUntilClosed(int fd, std::chrono::milliseconds totalTimeout = 2000ms);

// True if the peer closed the connection within 'timeout'.
bool waitForPeerClose(int fd, std::chrono::milliseconds timeout = 1000ms);

std::string buildRequest(const RequestOptions& opt);

std::optional<ParsedResponse> parseResponse(std::string_view raw);

// Sends one request on a fresh connection and parses the response. Throws std::runtime_error on failure.
ParsedResponse requestOrThrow(uint16_t port, const RequestOptions& opt = {});

// Client side of the WebSocket protocol, enough to drive a server in tests.
struct ReceivedFrame {
  websocket::Opcode opcode{websocket::Opcode::Text};
  bool fin{true};
  std::string payload;
};

class WebSocketTestClient {
 public:
  // Connects and performs the opening handshake on 'target', keeping the raw HTTP response.
  // Throws std::runtime_error if the server does not answer 101.
  WebSocketTestClient(uint16_t port, std::string_view target, std::vector<std::string> subprotocols = {});

  void sendText(std::string_view text) const;

  void sendBinary(std::string_view data) const;

  void sendFrame(websocket::Opcode opcode, std::string_view payload, bool fin = true) const;

  void sendClose(uint16_t code = 1000, std::string_view reason = {}) const;

  // Next frame from the server, std::nullopt on timeout or connection closed.
  std::optional<ReceivedFrame> receive(std::chrono::milliseconds timeout = 2000ms);

  [[nodiscard]] const std::string& handshakeResponse() const noexcept { return _handshakeResponse; }

  [[nodiscard]] int fd() const noexcept { return _connection.fd(); }

 private:
  ClientConnection _connection;
  std::string _handshakeResponse;
  std::string _buffer;
};

}  // namespace ignyx::test

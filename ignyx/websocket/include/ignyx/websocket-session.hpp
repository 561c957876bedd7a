#pragma once

#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "ignyx/handler-task.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/timedef.hpp"
#include "ignyx/json.hpp"
#include "ignyx/suspension.hpp"
#include "ignyx/websocket-config.hpp"
#include "ignyx/websocket-protocol.hpp"
#include "ignyx/websocket-upgrade.hpp"

namespace ignyx {

struct WebSocketMessage {
  std::string data;
  bool binary{false};
};

// One WebSocket connection as seen by its handler.
//
// The handler side (accept, send*, receive*, close) runs under the call-lock on worker threads. The transport
// side (onInput, drain, onTransportClosed) is called by the reactor owning the connection. Both sides
// synchronize on an internal mutex; sends never block, they queue frames and wake the reactor up.
//
// Lifecycle: Connecting -> accept() -> Open -> Closing -> Closed. Closing before accept() refuses the upgrade
// with 403. Once Closed, sends and receives (when no message is left) throw ConnectionClosed.
class WebSocketSession {
 public:
  enum class State : uint8_t { Connecting, Open, Closing, Closed };

  // Signals the reactor that output is available or that the connection state changed. Called from any thread,
  // never with the session mutex held.
  using WakeupFn = std::function<void()>;

  WebSocketSession(HttpRequest request, UpgradeValidationResult handshake, websocket::WebSocketConfig config,
                   WakeupFn wakeup);

  WebSocketSession(const WebSocketSession&) = delete;
  WebSocketSession& operator=(const WebSocketSession&) = delete;

  ~WebSocketSession();

  // Upgrade request, with the path parameters of the matched route.
  [[nodiscard]] const HttpRequest& request() const noexcept { return _request; }

  [[nodiscard]] std::span<const std::string> offeredSubprotocols() const noexcept {
    return {_handshake.offeredProtocols.data(), _handshake.offeredProtocols.size()};
  }

  [[nodiscard]] State state() const;

  // Close code once Closing or Closed (1006 for an abrupt disconnection).
  [[nodiscard]] uint16_t closeCode() const;

  // Completes the handshake. Throws std::logic_error if already accepted, std::invalid_argument if 'subprotocol'
  // was not offered by the client, ConnectionClosed if the client is gone.
  void accept(std::optional<std::string_view> subprotocol = std::nullopt);

  void sendText(std::string_view text);

  void sendBytes(std::span<const std::byte> data);

  void sendJson(const Json& value);

  // Awaitable yielding the next message. The call-lock is released while waiting.
  // Messages received before the connection closed are still yielded in order, then ConnectionClosed is thrown.
  class ReceiveAwaiter {
   public:
    explicit ReceiveAwaiter(WebSocketSession& session) noexcept : _session(session) {}

    [[nodiscard]] bool await_ready() const;

    bool await_suspend(std::coroutine_handle<> handle);

    WebSocketMessage await_resume();

   private:
    WebSocketSession& _session;
  };

  [[nodiscard]] ReceiveAwaiter receive() noexcept { return ReceiveAwaiter(*this); }

  // Next message as text. Throws std::invalid_argument for a binary message.
  [[nodiscard]] HandlerTask<std::string> receiveText();

  // Next message decoded as JSON. Throws std::invalid_argument if it is not a valid JSON document.
  [[nodiscard]] HandlerTask<Json> receiveJson();

  // Starts the close handshake (or refuses the upgrade if not accepted yet). No-op once closing.
  void close(uint16_t code = 1000, std::string_view reason = {});

  // Transport side.

  // Feeds bytes received from the peer.
  void onInput(std::span<const std::byte> data);

  struct Drained {
    // Bytes to write, handshake response first.
    std::string output;
    // Close the transport once 'output' (and anything written before) is flushed.
    bool closeTransport{false};
    // Too many received bytes wait for the handler: stop reading until the next wakeup.
    bool pauseReading{false};
  };

  [[nodiscard]] Drained drain();

  // Gives up waiting for the peer's Close after the configured timeout. Returns true if it did.
  bool checkCloseTimeout(SteadyTimePoint now = SteadyClock::now());

  // Server shutdown: closes with 1001.
  void goingAway();

  // The connection is gone. Wakes up a pending receive.
  void onTransportClosed() noexcept;

  // Engine side: the handler returned ('error' null) or failed. Closes the connection accordingly.
  void finish(std::exception_ptr error);

  [[nodiscard]] const websocket::WebSocketConfig& config() const noexcept { return _config; }

 private:
  // The helpers below expect _mutex to be held. Those returning a resume function must have it called once the
  // mutex is released.
  SuspensionContext::ResumeFn feed(std::span<const std::byte> data);
  SuspensionContext::ResumeFn transitionToClosed(uint16_t code);
  void rejectHandshake(http::StatusCode status);
  void throwIfNotOpen() const;

  [[nodiscard]] bool isReceiveReady() const noexcept {
    return !_inbound.empty() || _state == State::Closed || _state == State::Connecting;
  }

  HttpRequest _request;
  UpgradeValidationResult _handshake;
  websocket::WebSocketConfig _config;
  WakeupFn _wakeup;

  mutable std::mutex _mutex;
  websocket::Protocol _protocol;
  State _state{State::Connecting};
  uint16_t _closeCode{0};
  std::string _output;        // HTTP handshake bytes and frames taken from the protocol
  std::string _pendingInput;  // bytes received before accept()
  std::deque<WebSocketMessage> _inbound;
  std::size_t _inboundBytes{0};
  SuspensionContext::ResumeFn _pendingReceive;
};

}  // namespace ignyx

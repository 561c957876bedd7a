#include "ignyx/websocket-session.hpp"

#include <algorithm>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <format>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/errors.hpp"
#include "ignyx/handler-task.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/json.hpp"
#include "ignyx/log.hpp"
#include "ignyx/suspension.hpp"
#include "ignyx/websocket-constants.hpp"
#include "ignyx/websocket-upgrade.hpp"

namespace ignyx {

namespace {

constexpr uint16_t kAbnormalClosure = static_cast<uint16_t>(websocket::CloseCode::AbnormalClosure);

void Resume(SuspensionContext::ResumeFn& resume) noexcept {
  if (!resume) {
    return;
  }
  try {
    resume();
  } catch (const std::exception& ex) {
    log::error("Unable to resume a WebSocket receive: {}", ex.what());
  }
}

}  // namespace

WebSocketSession::WebSocketSession(HttpRequest request, UpgradeValidationResult handshake,
                                   websocket::WebSocketConfig config, WakeupFn wakeup)
    : _request(std::move(request)),
      _handshake(std::move(handshake)),
      _config(config),
      _wakeup(std::move(wakeup)),
      _protocol(config, websocket::ProtocolCallbacks{
                            .onMessage =
                                [this](std::string payload, bool isBinary) {
                                  _inboundBytes += payload.size();
                                  _inbound.push_back(WebSocketMessage{std::move(payload), isBinary});
                                },
                            .onClose = {},
                            .onError = {},
                        }) {}

WebSocketSession::~WebSocketSession() = default;

WebSocketSession::State WebSocketSession::state() const {
  std::lock_guard lock(_mutex);
  return _state;
}

uint16_t WebSocketSession::closeCode() const {
  std::lock_guard lock(_mutex);
  return _closeCode;
}

void WebSocketSession::accept(std::optional<std::string_view> subprotocol) {
  SuspensionContext::ResumeFn resume;
  {
    std::lock_guard lock(_mutex);
    if (_state == State::Closed) {
      throw ConnectionClosed(_closeCode, "Client disconnected before the handshake completed");
    }
    if (_state != State::Connecting) {
      throw std::logic_error("WebSocket connection already accepted");
    }
    if (subprotocol.has_value() && std::ranges::find(_handshake.offeredProtocols, *subprotocol) ==
                                       _handshake.offeredProtocols.end()) {
      throw std::invalid_argument(std::format("Subprotocol '{}' was not offered by the client", *subprotocol));
    }
    _output.append(BuildWebSocketUpgradeResponse(_handshake, subprotocol).serializeHead(HttpResponse::WireOptions{}));
    _state = State::Open;
    log::debug("WebSocket {} accepted", _request.path());
    if (!_pendingInput.empty()) {
      const std::string pending = std::exchange(_pendingInput, {});
      resume = feed(std::as_bytes(std::span(pending)));
    }
  }
  Resume(resume);
  _wakeup();
}

void WebSocketSession::sendText(std::string_view text) {
  {
    std::lock_guard lock(_mutex);
    throwIfNotOpen();
    _protocol.sendText(text);
    _output.append(_protocol.takeOutput());
  }
  _wakeup();
}

void WebSocketSession::sendBytes(std::span<const std::byte> data) {
  {
    std::lock_guard lock(_mutex);
    throwIfNotOpen();
    _protocol.sendBinary(data);
    _output.append(_protocol.takeOutput());
  }
  _wakeup();
}

void WebSocketSession::sendJson(const Json& value) { sendText(DumpJson(value)); }

bool WebSocketSession::ReceiveAwaiter::await_ready() const {
  std::lock_guard lock(_session._mutex);
  return _session.isReceiveReady();
}

bool WebSocketSession::ReceiveAwaiter::await_suspend(std::coroutine_handle<> handle) {
  std::lock_guard lock(_session._mutex);
  if (_session.isReceiveReady()) {
    return false;
  }
  if (_session._pendingReceive) {
    throw std::logic_error("Only one receive can be pending on a WebSocket session");
  }
  _session._pendingReceive = SuspensionContext::Current().prepareResume(handle);
  return true;
}

WebSocketMessage WebSocketSession::ReceiveAwaiter::await_resume() {
  std::unique_lock lock(_session._mutex);
  if (_session._state == State::Connecting) {
    throw std::logic_error("WebSocket connection not accepted yet");
  }
  if (_session._inbound.empty()) {
    throw ConnectionClosed(_session._closeCode);
  }
  const bool wasPaused = _session._inboundBytes > _session._config.highWaterMark;
  WebSocketMessage message = std::move(_session._inbound.front());
  _session._inbound.pop_front();
  _session._inboundBytes -= message.data.size();
  const bool resumeReading = wasPaused && _session._inboundBytes <= _session._config.highWaterMark;
  lock.unlock();
  if (resumeReading) {
    _session._wakeup();
  }
  return message;
}

HandlerTask<std::string> WebSocketSession::receiveText() {
  WebSocketMessage message = co_await receive();
  if (message.binary) {
    throw std::invalid_argument("Expected a text message, received a binary one");
  }
  co_return std::move(message.data);
}

HandlerTask<Json> WebSocketSession::receiveJson() {
  WebSocketMessage message = co_await receive();
  std::optional<Json> value = ParseJson(message.data);
  if (!value) {
    throw std::invalid_argument("Received message is not a valid JSON document");
  }
  co_return std::move(*value);
}

void WebSocketSession::close(uint16_t code, std::string_view reason) {
  SuspensionContext::ResumeFn resume;
  {
    std::lock_guard lock(_mutex);
    switch (_state) {
      case State::Connecting:
        rejectHandshake(http::StatusCodeForbidden);
        resume = transitionToClosed(code);
        break;
      case State::Open:
        if (!websocket::IsValidWireCloseCode(code)) {
          throw std::invalid_argument(std::format("Invalid WebSocket close code {}", code));
        }
        _protocol.sendClose(static_cast<websocket::CloseCode>(code), reason);
        _output.append(_protocol.takeOutput());
        _state = State::Closing;
        _closeCode = code;
        break;
      default:
        return;
    }
  }
  Resume(resume);
  _wakeup();
}

void WebSocketSession::onInput(std::span<const std::byte> data) {
  SuspensionContext::ResumeFn resume;
  {
    std::lock_guard lock(_mutex);
    if (_state == State::Connecting) {
      // Only expected from a client not waiting for the handshake response.
      _pendingInput.append(reinterpret_cast<const char*>(data.data()), data.size());
      return;
    }
    resume = feed(data);
  }
  Resume(resume);
}

WebSocketSession::Drained WebSocketSession::drain() {
  std::lock_guard lock(_mutex);
  Drained drained;
  // Output is complete once Closed: read the state with the output under the same lock.
  drained.closeTransport = _state == State::Closed;
  drained.output = std::exchange(_output, {});
  drained.pauseReading = _inboundBytes > _config.highWaterMark;
  return drained;
}

bool WebSocketSession::checkCloseTimeout(SteadyTimePoint now) {
  SuspensionContext::ResumeFn resume;
  {
    std::lock_guard lock(_mutex);
    if (_state != State::Closing || !_protocol.hasCloseTimedOut(now)) {
      return false;
    }
    log::debug("WebSocket {} did not answer our Close in time", _request.path());
    _protocol.forceCloseOnTimeout();
    resume = transitionToClosed(_closeCode);
  }
  Resume(resume);
  return true;
}

void WebSocketSession::goingAway() {
  SuspensionContext::ResumeFn resume;
  {
    std::lock_guard lock(_mutex);
    if (_state == State::Connecting) {
      rejectHandshake(http::StatusCodeServiceUnavailable);
      resume = transitionToClosed(static_cast<uint16_t>(websocket::CloseCode::GoingAway));
    } else if (_state == State::Open) {
      _protocol.sendClose(websocket::CloseCode::GoingAway, "Server shutting down");
      _output.append(_protocol.takeOutput());
      _state = State::Closing;
      _closeCode = static_cast<uint16_t>(websocket::CloseCode::GoingAway);
    } else {
      return;
    }
  }
  Resume(resume);
  _wakeup();
}

void WebSocketSession::onTransportClosed() noexcept {
  SuspensionContext::ResumeFn resume;
  {
    std::lock_guard lock(_mutex);
    _protocol.onTransportClosing();
    _pendingInput.clear();
    _output.clear();
    if (_state != State::Closed) {
      if (_state != State::Closing) {
        _closeCode = kAbnormalClosure;
      }
      resume = transitionToClosed(kAbnormalClosure);
    }
  }
  Resume(resume);
}

void WebSocketSession::finish(std::exception_ptr error) {
  http::StatusCode rejectionStatus = http::StatusCodeForbidden;
  uint16_t code = static_cast<uint16_t>(websocket::CloseCode::Normal);
  if (error) {
    try {
      std::rethrow_exception(error);
    } catch (const ConnectionClosed& ex) {
      log::debug("WebSocket handler for {} ended on a closed connection ({})", _request.path(), ex.closeCode());
    } catch (const std::exception& ex) {
      log::error("WebSocket handler for {} failed: {}", _request.path(), ex.what());
      rejectionStatus = StatusOf(ex);
      code = static_cast<uint16_t>(websocket::CloseCode::InternalError);
    }
  }

  SuspensionContext::ResumeFn resume;
  {
    std::lock_guard lock(_mutex);
    if (_state == State::Connecting) {
      rejectHandshake(rejectionStatus);
      resume = transitionToClosed(code);
    } else if (_state == State::Open) {
      _protocol.sendClose(static_cast<websocket::CloseCode>(code), {});
      _output.append(_protocol.takeOutput());
      _state = State::Closing;
      _closeCode = code;
    } else {
      return;
    }
  }
  Resume(resume);
  _wakeup();
}

SuspensionContext::ResumeFn WebSocketSession::feed(std::span<const std::byte> data) {
  if (_state == State::Closed) {
    return {};
  }
  const websocket::ProcessResult result = _protocol.processInput(data);
  _output.append(_protocol.takeOutput());
  if (result.action == websocket::ProcessResult::Action::Close) {
    return transitionToClosed(static_cast<uint16_t>(_protocol.closeCode()));
  }
  if (!_inbound.empty()) {
    return std::exchange(_pendingReceive, {});
  }
  return {};
}

SuspensionContext::ResumeFn WebSocketSession::transitionToClosed(uint16_t code) {
  _state = State::Closed;
  if (_closeCode == 0) {
    _closeCode = code;
  }
  return std::exchange(_pendingReceive, {});
}

void WebSocketSession::rejectHandshake(http::StatusCode status) {
  log::debug("WebSocket {} refused with status {}", _request.path(), status);
  HttpResponse response(status);
  _output.append(response.serialize(HttpResponse::WireOptions{.headRequest = false, .keepAlive = false}));
}

void WebSocketSession::throwIfNotOpen() const {
  if (_state == State::Connecting) {
    throw std::logic_error("WebSocket connection not accepted yet");
  }
  if (_state != State::Open) {
    throw ConnectionClosed(_closeCode);
  }
}

}  // namespace ignyx

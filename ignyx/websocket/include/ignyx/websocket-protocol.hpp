#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>

#include "ignyx/timedef.hpp"
#include "ignyx/websocket-config.hpp"
#include "ignyx/websocket-constants.hpp"
#include "ignyx/websocket-frame.hpp"

namespace ignyx::websocket {

struct ProtocolCallbacks {
  // A complete message (fragments reassembled). Text messages are valid UTF-8.
  std::function<void(std::string payload, bool isBinary)> onMessage;

  // The peer sent a Close frame. The echo is already queued.
  std::function<void(CloseCode code, std::string_view reason)> onClose;

  // Protocol violation. A Close frame carrying 'code' is already queued.
  std::function<void(CloseCode code, std::string_view message)> onError;
};

struct ProcessResult {
  enum class Action : uint8_t {
    Continue,
    Close,  // flush pending output, then close the transport
  };

  Action action{Action::Continue};
  std::size_t bytesConsumed{0};
};

// RFC 6455 framing state machine: frame parsing, message reassembly, control frames and close handshake.
// It does no I/O: input is pushed by processInput(), output accumulates until takeOutput().
// Not thread-safe.
class Protocol {
 public:
  explicit Protocol(WebSocketConfig config = {}, ProtocolCallbacks callbacks = {});

  // Consumes 'data'. An incomplete trailing frame is kept for the next call.
  ProcessResult processInput(std::span<const std::byte> data);

  [[nodiscard]] bool hasPendingOutput() const noexcept { return !_outputBuffer.empty(); }

  [[nodiscard]] std::size_t pendingOutputSize() const noexcept { return _outputBuffer.size(); }

  // Moves out the bytes to write.
  [[nodiscard]] std::string takeOutput() noexcept;

  // Each send returns false if nothing was queued because the connection is closing.
  bool sendText(std::string_view text);

  bool sendBinary(std::span<const std::byte> data);

  // Payload is truncated to 125 bytes.
  bool sendPing(std::span<const std::byte> payload = {});

  // Allowed during the close handshake.
  bool sendPong(std::span<const std::byte> payload);

  bool sendClose(CloseCode code = CloseCode::Normal, std::string_view reason = {});

  [[nodiscard]] bool isClosing() const noexcept { return _closeState != CloseState::Open; }

  [[nodiscard]] bool isCloseComplete() const noexcept { return _closeState == CloseState::Closed; }

  // Code of the Close frame sent or received last.
  [[nodiscard]] CloseCode closeCode() const noexcept { return _closeCode; }

  [[nodiscard]] bool hasCloseTimedOut(SteadyTimePoint now = SteadyClock::now()) const noexcept {
    return _closeState == CloseState::CloseSent && now - _closeInitiatedAt > _config.closeTimeout;
  }

  void forceCloseOnTimeout() noexcept {
    if (_closeState == CloseState::CloseSent) {
      _closeState = CloseState::Closed;
    }
  }

  // The transport is gone: drop all state.
  void onTransportClosing() noexcept;

  [[nodiscard]] const WebSocketConfig& config() const noexcept { return _config; }

 private:
  enum class CloseState : uint8_t {
    Open,
    CloseSent,  // waiting for the peer's Close
    Closed,
  };

  struct MessageState {
    std::string buffer;
    Opcode opcode{Opcode::Text};
    bool inProgress{false};
  };

  ProcessResult::Action processFrame(const FrameParseResult& frame);

  ProcessResult::Action handleDataFrame(const FrameHeader& header, std::span<const std::byte> payload);

  ProcessResult::Action handleControlFrame(const FrameHeader& header, std::span<const std::byte> payload);

  ProcessResult::Action completeMessage();

  ProcessResult::Action fail(CloseCode code, std::string_view message);

  void queueFrame(Opcode opcode, std::span<const std::byte> payload, bool fin = true);

  WebSocketConfig _config;
  ProtocolCallbacks _callbacks;
  SteadyTimePoint _closeInitiatedAt;
  std::string _outputBuffer;
  std::string _inputBuffer;  // carry-over of an incomplete frame
  MessageState _message;
  CloseCode _closeCode{CloseCode::NoStatusReceived};
  CloseState _closeState{CloseState::Open};
};

}  // namespace ignyx::websocket

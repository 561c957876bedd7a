#include "ignyx/websocket-protocol.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/log.hpp"
#include "ignyx/timedef.hpp"
#include "ignyx/websocket-constants.hpp"
#include "ignyx/websocket-frame.hpp"

namespace ignyx::websocket {

Protocol::Protocol(WebSocketConfig config, ProtocolCallbacks callbacks)
    : _config(config), _callbacks(std::move(callbacks)) {}

ProcessResult Protocol::processInput(std::span<const std::byte> data) {
  ProcessResult result;
  if (_closeState == CloseState::Closed) {
    result.bytesConsumed = data.size();
    return result;
  }

  if (!_inputBuffer.empty()) {
    _inputBuffer.append(reinterpret_cast<const char*>(data.data()), data.size());
    data = std::as_bytes(std::span(_inputBuffer));
  }

  std::size_t totalConsumed = 0;
  while (totalConsumed < data.size()) {
    const auto remaining = data.subspan(totalConsumed);
    const FrameParseResult frameResult = ParseFrame(remaining, _config.maxFrameSize, _config.isServerSide);

    if (frameResult.status == FrameParseResult::Status::Incomplete) {
      // Keep the remainder for the next call.
      std::string remainder(reinterpret_cast<const char*>(remaining.data()), remaining.size());
      _inputBuffer = std::move(remainder);
      result.bytesConsumed = data.size();
      return result;
    }

    if (frameResult.status == FrameParseResult::Status::ProtocolError) {
      _inputBuffer.clear();
      result.action = fail(CloseCode::ProtocolError, frameResult.errorMessage);
      result.bytesConsumed = data.size();
      return result;
    }

    if (frameResult.status == FrameParseResult::Status::PayloadTooLarge) {
      _inputBuffer.clear();
      result.action = fail(CloseCode::MessageTooBig, "Frame payload too large");
      result.bytesConsumed = data.size();
      return result;
    }

    totalConsumed += frameResult.bytesConsumed;
    if (processFrame(frameResult) == ProcessResult::Action::Close) {
      _inputBuffer.clear();
      result.action = ProcessResult::Action::Close;
      result.bytesConsumed = data.size();
      return result;
    }
  }

  _inputBuffer.clear();
  result.bytesConsumed = data.size();
  return result;
}

ProcessResult::Action Protocol::processFrame(const FrameParseResult& frame) {
  std::span<const std::byte> payload = frame.payload;
  std::string unmaskedPayload;

  if (frame.header.masked) {
    unmaskedPayload.assign(reinterpret_cast<const char*>(payload.data()), payload.size());
    ApplyMask(std::as_writable_bytes(std::span(unmaskedPayload)), frame.header.maskingKey);
    payload = std::as_bytes(std::span(unmaskedPayload));
  }

  if (IsControlFrame(frame.header.opcode)) {
    return handleControlFrame(frame.header, payload);
  }
  return handleDataFrame(frame.header, payload);
}

ProcessResult::Action Protocol::handleDataFrame(const FrameHeader& header, std::span<const std::byte> payload) {
  if (header.opcode == Opcode::Continuation) {
    if (!_message.inProgress) {
      return fail(CloseCode::ProtocolError, "Unexpected continuation frame");
    }
  } else {
    if (_message.inProgress) {
      return fail(CloseCode::ProtocolError, "Expected continuation frame");
    }
    _message.opcode = header.opcode;
    _message.inProgress = true;
    _message.buffer.clear();
  }

  const std::size_t newSize = _message.buffer.size() + payload.size();
  if (_config.maxMessageSize > 0 && newSize > _config.maxMessageSize) {
    _message.inProgress = false;
    _message.buffer.clear();
    return fail(CloseCode::MessageTooBig, "Message too large");
  }

  _message.buffer.append(reinterpret_cast<const char*>(payload.data()), payload.size());

  if (header.fin) {
    return completeMessage();
  }
  return ProcessResult::Action::Continue;
}

ProcessResult::Action Protocol::handleControlFrame(const FrameHeader& header, std::span<const std::byte> payload) {
  switch (header.opcode) {
    case Opcode::Ping:
      sendPong(payload);
      return ProcessResult::Action::Continue;
    case Opcode::Pong:
      return ProcessResult::Action::Continue;
    case Opcode::Close: {
      const ClosePayload closeInfo = ParseClosePayload(payload);
      if (!closeInfo.valid) {
        return fail(CloseCode::ProtocolError, "Invalid close payload");
      }
      if (closeInfo.code != CloseCode::NoStatusReceived &&
          !IsValidUtf8(std::as_bytes(std::span(closeInfo.reason.data(), closeInfo.reason.size())))) {
        return fail(CloseCode::InvalidPayloadData, "Invalid UTF-8 in close reason");
      }

      if (_closeState == CloseState::Open) {
        // Peer initiated: echo its code.
        BuildCloseFrame(_outputBuffer, closeInfo.code, {}, !_config.isServerSide);
      }
      _closeState = CloseState::Closed;
      _closeCode = closeInfo.code;
      if (_callbacks.onClose) {
        _callbacks.onClose(closeInfo.code, closeInfo.reason);
      }
      return ProcessResult::Action::Close;
    }
    default:
      // ParseFrame rejects reserved opcodes.
      log::error("Unexpected WebSocket control opcode {}", static_cast<int>(header.opcode));
      return fail(CloseCode::ProtocolError, "Unexpected control opcode");
  }
}

ProcessResult::Action Protocol::completeMessage() {
  std::string message = std::exchange(_message.buffer, {});
  _message.inProgress = false;

  const bool isBinary = _message.opcode == Opcode::Binary;
  if (!isBinary && !IsValidUtf8(std::as_bytes(std::span(message)))) {
    return fail(CloseCode::InvalidPayloadData, "Invalid UTF-8 in text message");
  }

  if (_callbacks.onMessage) {
    _callbacks.onMessage(std::move(message), isBinary);
  }
  return ProcessResult::Action::Continue;
}

ProcessResult::Action Protocol::fail(CloseCode code, std::string_view message) {
  log::debug("WebSocket protocol error: {}", message);
  if (_callbacks.onError) {
    _callbacks.onError(code, message);
  }
  sendClose(code, message);
  _closeState = CloseState::Closed;
  return ProcessResult::Action::Close;
}

std::string Protocol::takeOutput() noexcept { return std::exchange(_outputBuffer, {}); }

void Protocol::onTransportClosing() noexcept {
  _closeState = CloseState::Closed;
  _message.inProgress = false;
  _message.buffer.clear();
  _inputBuffer.clear();
}

void Protocol::queueFrame(Opcode opcode, std::span<const std::byte> payload, bool fin) {
  // Zero key when acting as a client: masking is only required by the protocol, not used for secrecy here.
  BuildFrame(_outputBuffer, opcode, payload, fin, !_config.isServerSide, MaskingKey{});
}

bool Protocol::sendText(std::string_view text) {
  if (_closeState != CloseState::Open) {
    return false;
  }
  queueFrame(Opcode::Text, std::as_bytes(std::span(text)));
  return true;
}

bool Protocol::sendBinary(std::span<const std::byte> data) {
  if (_closeState != CloseState::Open) {
    return false;
  }
  queueFrame(Opcode::Binary, data);
  return true;
}

bool Protocol::sendPing(std::span<const std::byte> payload) {
  if (_closeState != CloseState::Open) {
    return false;
  }
  if (payload.size() > kMaxControlFramePayload) {
    payload = payload.first(kMaxControlFramePayload);
  }
  queueFrame(Opcode::Ping, payload);
  return true;
}

bool Protocol::sendPong(std::span<const std::byte> payload) {
  if (_closeState == CloseState::Closed) {
    return false;
  }
  if (payload.size() > kMaxControlFramePayload) {
    payload = payload.first(kMaxControlFramePayload);
  }
  queueFrame(Opcode::Pong, payload);
  return true;
}

bool Protocol::sendClose(CloseCode code, std::string_view reason) {
  if (_closeState != CloseState::Open) {
    return false;
  }
  BuildCloseFrame(_outputBuffer, code, reason, !_config.isServerSide);
  _closeState = CloseState::CloseSent;
  _closeInitiatedAt = SteadyClock::now();
  _closeCode = code;
  return true;
}

}  // namespace ignyx::websocket

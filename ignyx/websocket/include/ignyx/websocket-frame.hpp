#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "ignyx/websocket-constants.hpp"

namespace ignyx::websocket {

using MaskingKey = std::array<std::byte, kMaskingKeySize>;

// Decoded frame header. The payload is not part of it.
struct FrameHeader {
  // 2 to 14 bytes depending on payload length and mask.
  [[nodiscard]] std::size_t headerSize() const noexcept;

  Opcode opcode{Opcode::Text};
  bool fin{true};
  bool masked{false};
  uint64_t payloadLength{0};
  MaskingKey maskingKey{};
};

struct FrameParseResult {
  enum class Status : uint8_t {
    Complete,
    Incomplete,       // more bytes needed
    ProtocolError,    // close with 1002
    PayloadTooLarge,  // close with 1009
  };

  Status status{Status::Incomplete};
  FrameHeader header;
  std::span<const std::byte> payload;  // view into the input buffer, still masked
  std::size_t bytesConsumed{0};
  std::string_view errorMessage;
};

// Parses one frame at the start of 'data'.
// 'maxPayloadSize' of 0 means unlimited. Server side requires masked frames, client side forbids them.
// No extension is supported: any RSV bit is a protocol error.
[[nodiscard]] FrameParseResult ParseFrame(std::span<const std::byte> data, std::size_t maxPayloadSize = 0,
                                          bool isServerSide = true);

// XOR masking, in place. Masking and unmasking are the same operation.
void ApplyMask(std::span<std::byte> data, MaskingKey maskingKey) noexcept;

// Appends a frame to 'output'. Control frames must have fin set and a payload of at most 125 bytes.
void BuildFrame(std::string& output, Opcode opcode, std::span<const std::byte> payload, bool fin = true,
                bool mask = false, MaskingKey maskingKey = {});

inline void BuildFrame(std::string& output, Opcode opcode, std::string_view payload, bool fin = true,
                       bool mask = false, MaskingKey maskingKey = {}) {
  BuildFrame(output, opcode, std::as_bytes(std::span(payload)), fin, mask, maskingKey);
}

// Appends a Close frame. The reason is truncated to fit in a control frame.
// CloseCode::NoStatusReceived produces an empty payload.
void BuildCloseFrame(std::string& output, CloseCode code = CloseCode::Normal, std::string_view reason = {},
                     bool mask = false, MaskingKey maskingKey = {});

struct ClosePayload {
  CloseCode code{CloseCode::NoStatusReceived};
  std::string_view reason;
  // False for a one byte payload or an invalid wire code.
  bool valid{true};
};

[[nodiscard]] ClosePayload ParseClosePayload(std::span<const std::byte> payload);

// RFC 3629 validation of a text message.
[[nodiscard]] bool IsValidUtf8(std::span<const std::byte> data) noexcept;

}  // namespace ignyx::websocket

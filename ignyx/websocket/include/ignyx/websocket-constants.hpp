#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ignyx::websocket {

// RFC 6455 §1.3, appended to the client key before hashing.
inline constexpr std::string_view kGUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

inline constexpr std::string_view kVersion = "13";

inline constexpr std::string_view kUpgradeValue = "websocket";

// Frame opcodes (RFC 6455 §5.2).
enum class Opcode : uint8_t {
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA,
};

[[nodiscard]] constexpr bool IsControlFrame(Opcode op) noexcept { return static_cast<uint8_t>(op) >= 0x8; }

// 0x3-0x7 and 0xB-0xF are reserved.
[[nodiscard]] constexpr bool IsReservedOpcode(std::byte rawOpcode) noexcept {
  return (rawOpcode >= std::byte{0x3} && rawOpcode <= std::byte{0x7}) ||
         (rawOpcode >= std::byte{0xB} && rawOpcode <= std::byte{0xF});
}

// Close status codes (RFC 6455 §7.4.1).
enum class CloseCode : uint16_t {
  Normal = 1000,
  GoingAway = 1001,
  ProtocolError = 1002,
  UnsupportedData = 1003,
  NoStatusReceived = 1005,  // API only, never sent
  AbnormalClosure = 1006,   // API only, never sent
  InvalidPayloadData = 1007,
  PolicyViolation = 1008,
  MessageTooBig = 1009,
  MandatoryExtension = 1010,
  InternalError = 1011,
};

// Codes 1005 and 1006 are reserved for APIs and must not appear in a Close frame.
[[nodiscard]] constexpr bool IsValidWireCloseCode(uint16_t code) noexcept {
  return (code >= 1000 && code <= 1003) || (code >= 1007 && code <= 1011) || (code >= 3000 && code <= 4999);
}

// First byte: FIN | RSV1 | RSV2 | RSV3 | OPCODE
inline constexpr std::byte kFinBit{0x80};
inline constexpr std::byte kRsv1Bit{0x40};
inline constexpr std::byte kRsv2Bit{0x20};
inline constexpr std::byte kRsv3Bit{0x10};
inline constexpr std::byte kOpcodeMask{0x0F};

// Second byte: MASK | payload length
inline constexpr std::byte kMaskBit{0x80};
inline constexpr std::byte kPayloadLenMask{0x7F};

inline constexpr std::byte kPayloadLen16{126};
inline constexpr std::byte kPayloadLen64{127};

inline constexpr std::size_t kMaxControlFramePayload = 125;

inline constexpr std::size_t kMaskingKeySize = 4;

inline constexpr std::size_t kMinFrameHeaderSize = 2;

inline constexpr std::size_t kDefaultMaxMessageSize = 16UL * 1024UL * 1024UL;
inline constexpr std::size_t kDefaultMaxFrameSize = 16UL * 1024UL * 1024UL;

}  // namespace ignyx::websocket

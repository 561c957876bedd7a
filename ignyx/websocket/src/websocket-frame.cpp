#include "ignyx/websocket-frame.hpp"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>

#include "ignyx/websocket-constants.hpp"

namespace ignyx::websocket {

namespace {

constexpr uint64_t kMaxPayloadLen16 = 0xFFFF;

uint64_t ReadBigEndian(const std::byte* first, std::size_t nbBytes) noexcept {
  uint64_t value = 0;
  for (const std::byte* it = first; it != first + nbBytes; ++it) {
    value = (value << 8) | std::to_integer<uint64_t>(*it);
  }
  return value;
}

void AppendBigEndian(std::string& output, uint64_t value, std::size_t nbBytes) {
  for (std::size_t shift = nbBytes * 8; shift != 0; shift -= 8) {
    output.push_back(static_cast<char>((value >> (shift - 8)) & 0xFF));
  }
}

// Bytes of the extended payload length announced by the 7 bit length field.
std::size_t ExtendedLengthSize(std::byte payloadLen7) noexcept {
  if (payloadLen7 == kPayloadLen16) {
    return 2;
  }
  if (payloadLen7 == kPayloadLen64) {
    return 8;
  }
  return 0;
}

FrameParseResult Failure(FrameParseResult::Status status, std::string_view message) {
  FrameParseResult result;
  result.status = status;
  result.errorMessage = message;
  return result;
}

FrameParseResult ProtocolError(std::string_view message) {
  return Failure(FrameParseResult::Status::ProtocolError, message);
}

}  // namespace

std::size_t FrameHeader::headerSize() const noexcept {
  std::size_t extendedLength = 0;
  if (payloadLength > kMaxPayloadLen16) {
    extendedLength = 8;
  } else if (payloadLength >= std::to_integer<uint64_t>(kPayloadLen16)) {
    extendedLength = 2;
  }
  return kMinFrameHeaderSize + extendedLength + (masked ? kMaskingKeySize : 0);
}

FrameParseResult ParseFrame(std::span<const std::byte> data, std::size_t maxPayloadSize, bool isServerSide) {
  if (data.size() < kMinFrameHeaderSize) {
    return {};
  }

  const std::byte first = data[0];
  const std::byte second = data[1];

  if ((first & (kRsv1Bit | kRsv2Bit | kRsv3Bit)) != std::byte{0}) {
    return ProtocolError("Reserved bits must be 0");
  }
  if (IsReservedOpcode(first & kOpcodeMask)) {
    return ProtocolError("Reserved opcode");
  }

  FrameHeader header;
  header.fin = (first & kFinBit) == kFinBit;
  header.opcode = static_cast<Opcode>(first & kOpcodeMask);
  header.masked = (second & kMaskBit) == kMaskBit;

  const bool isControl = IsControlFrame(header.opcode);
  if (isControl && !header.fin) {
    return ProtocolError("Control frames must not be fragmented");
  }
  if (header.masked != isServerSide) {
    return ProtocolError(isServerSide ? "Client frames must be masked" : "Server frames must not be masked");
  }

  const std::byte payloadLen7 = second & kPayloadLenMask;
  const std::size_t extendedLengthSize = ExtendedLengthSize(payloadLen7);
  std::size_t pos = kMinFrameHeaderSize + extendedLengthSize;
  if (data.size() < pos) {
    return {};
  }

  switch (extendedLengthSize) {
    case 0:
      header.payloadLength = std::to_integer<uint64_t>(payloadLen7);
      break;
    case 2:
      header.payloadLength = ReadBigEndian(data.data() + kMinFrameHeaderSize, 2);
      // RFC 6455 §5.2: the length must use the minimal number of bytes.
      if (header.payloadLength < std::to_integer<uint64_t>(kPayloadLen16)) {
        return ProtocolError("Non-minimal extended length encoding");
      }
      break;
    default:
      header.payloadLength = ReadBigEndian(data.data() + kMinFrameHeaderSize, 8);
      if (std::countl_zero(header.payloadLength) == 0) {
        return ProtocolError("Invalid payload length (MSB set)");
      }
      if (header.payloadLength <= kMaxPayloadLen16) {
        return ProtocolError("Non-minimal extended length encoding");
      }
      break;
  }

  if (isControl && header.payloadLength > kMaxControlFramePayload) {
    return ProtocolError("Control frame payload too large");
  }
  if (maxPayloadSize != 0 && header.payloadLength > maxPayloadSize) {
    return Failure(FrameParseResult::Status::PayloadTooLarge, "Payload exceeds maximum size");
  }

  if (header.masked) {
    if (data.size() < pos + kMaskingKeySize) {
      return {};
    }
    std::memcpy(header.maskingKey.data(), data.data() + pos, kMaskingKeySize);
    pos += kMaskingKeySize;
  }

  const auto payloadSize = static_cast<std::size_t>(header.payloadLength);
  if (data.size() - pos < payloadSize) {
    return {};
  }

  FrameParseResult result;
  result.status = FrameParseResult::Status::Complete;
  result.header = header;
  result.payload = data.subspan(pos, payloadSize);
  result.bytesConsumed = pos + payloadSize;
  return result;
}

void ApplyMask(std::span<std::byte> data, MaskingKey maskingKey) noexcept {
  for (std::size_t pos = 0; pos < data.size(); ++pos) {
    data[pos] ^= maskingKey[pos % kMaskingKeySize];
  }
}

void BuildFrame(std::string& output, Opcode opcode, std::span<const std::byte> payload, bool fin, bool mask,
                MaskingKey maskingKey) {
  const uint64_t payloadSize = payload.size();
  const FrameHeader header{.opcode = opcode, .fin = fin, .masked = mask, .payloadLength = payloadSize};
  output.reserve(output.size() + header.headerSize() + payload.size());

  output.push_back(static_cast<char>(static_cast<std::byte>(opcode) | (fin ? kFinBit : std::byte{0})));

  const std::byte maskBit = mask ? kMaskBit : std::byte{0};
  if (payloadSize < std::to_integer<uint64_t>(kPayloadLen16)) {
    output.push_back(static_cast<char>(maskBit | static_cast<std::byte>(payloadSize)));
  } else if (payloadSize <= kMaxPayloadLen16) {
    output.push_back(static_cast<char>(maskBit | kPayloadLen16));
    AppendBigEndian(output, payloadSize, 2);
  } else {
    output.push_back(static_cast<char>(maskBit | kPayloadLen64));
    AppendBigEndian(output, payloadSize, 8);
  }

  if (mask) {
    output.append(reinterpret_cast<const char*>(maskingKey.data()), kMaskingKeySize);
  }

  if (payload.empty()) {
    return;
  }
  const std::size_t payloadPos = output.size();
  output.append(reinterpret_cast<const char*>(payload.data()), payload.size());
  if (mask) {
    ApplyMask(std::as_writable_bytes(std::span(output).subspan(payloadPos)), maskingKey);
  }
}

void BuildCloseFrame(std::string& output, CloseCode code, std::string_view reason, bool mask, MaskingKey maskingKey) {
  std::string payload;
  if (code != CloseCode::NoStatusReceived) {
    AppendBigEndian(payload, static_cast<uint16_t>(code), 2);
    payload.append(reason.substr(0, kMaxControlFramePayload - 2));
  }
  BuildFrame(output, Opcode::Close, std::string_view(payload), true, mask, maskingKey);
}

ClosePayload ParseClosePayload(std::span<const std::byte> payload) {
  ClosePayload result;
  switch (payload.size()) {
    case 0:
      break;
    case 1:
      result.code = CloseCode::ProtocolError;
      result.valid = false;
      break;
    default: {
      const auto code = static_cast<uint16_t>(ReadBigEndian(payload.data(), 2));
      result.code = static_cast<CloseCode>(code);
      result.valid = IsValidWireCloseCode(code);
      const auto reason = payload.subspan(2);
      result.reason = std::string_view(reinterpret_cast<const char*>(reason.data()), reason.size());
      break;
    }
  }
  return result;
}

bool IsValidUtf8(std::span<const std::byte> data) noexcept {
  // Smallest code point for sequences of 2, 3 and 4 bytes, to reject overlong forms.
  static constexpr uint32_t kMinCodePoint[] = {0, 0, 0x80, 0x800, 0x10000};

  std::size_t pos = 0;
  while (pos < data.size()) {
    const auto lead = std::to_integer<uint8_t>(data[pos]);
    const int seqLen = lead < 0x80 ? 1 : std::countl_one(lead);
    if (seqLen == 1) {
      ++pos;
      continue;
    }
    if (seqLen < 2 || seqLen > 4 || data.size() - pos < static_cast<std::size_t>(seqLen)) {
      return false;
    }

    uint32_t codePoint = lead & (0x7FU >> seqLen);
    for (int idx = 1; idx < seqLen; ++idx) {
      const auto cont = std::to_integer<uint8_t>(data[pos + static_cast<std::size_t>(idx)]);
      if ((cont & 0xC0) != 0x80) {
        return false;
      }
      codePoint = (codePoint << 6) | (cont & 0x3FU);
    }

    if (codePoint < kMinCodePoint[seqLen] || (codePoint >= 0xD800 && codePoint <= 0xDFFF) || codePoint > 0x10FFFF) {
      return false;
    }
    pos += static_cast<std::size_t>(seqLen);
  }
  return true;
}

}  // namespace ignyx::websocket

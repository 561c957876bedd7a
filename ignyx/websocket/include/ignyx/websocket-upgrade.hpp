#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

#include "ignyx/http-request.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

// Base64-encoded SHA-1 is always 28 chars.
using B64EncodedSha1 = std::array<char, 28>;

struct UpgradeValidationResult {
  bool valid{false};
  B64EncodedSha1 secWebSocketAccept{};
  std::string_view errorMessage;  // set if !valid
  // Protocols listed in Sec-WebSocket-Protocol, in client order.
  vector<std::string> offeredProtocols;
};

// A valid key is exactly 24 base64 characters (16 random bytes).
[[nodiscard]] bool IsValidWebSocketKey(std::string_view key);

// base64(SHA-1(key + GUID)), RFC 6455 §1.3.
[[nodiscard]] B64EncodedSha1 ComputeWebSocketAccept(std::string_view key);

// Checks the handshake headers of an upgrade request (RFC 6455 §4.2.1).
[[nodiscard]] UpgradeValidationResult ValidateWebSocketUpgrade(const HttpRequest& request);

// 101 response completing a validated handshake. 'subprotocol' must be one of the offered protocols.
[[nodiscard]] HttpResponse BuildWebSocketUpgradeResponse(const UpgradeValidationResult& validationResult,
                                                         std::optional<std::string_view> subprotocol);

// Handshake refusal: 426 with the supported version for a version mismatch, 400 otherwise.
[[nodiscard]] HttpResponse BuildWebSocketUpgradeRejection(const HttpRequest& request,
                                                          const UpgradeValidationResult& validationResult);

}  // namespace ignyx

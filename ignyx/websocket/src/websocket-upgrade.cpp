#include "ignyx/websocket-upgrade.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "ignyx/http-constants.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/string-trim.hpp"
#include "ignyx/websocket-constants.hpp"

namespace ignyx {

namespace {

[[nodiscard]] constexpr bool IsBase64Char(char ch) noexcept {
  return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '+' || ch == '/' ||
         ch == '=';
}

vector<std::string> ParseTokenList(std::string_view value) {
  vector<std::string> tokens;
  while (!value.empty()) {
    const auto commaPos = value.find(',');
    std::string_view token = Trim(value.substr(0, commaPos), kOws);
    if (!token.empty()) {
      tokens.emplace_back(token);
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    value.remove_prefix(commaPos + 1);
  }
  return tokens;
}

}  // namespace

bool IsValidWebSocketKey(std::string_view key) {
  if (key.size() != 24) {
    return false;
  }
  if (!std::ranges::all_of(key, [](char ch) { return IsBase64Char(ch); })) {
    return false;
  }
  // 16 bytes encode to 22 chars + 2 padding
  return key[22] == '=' && key[23] == '=';
}

B64EncodedSha1 ComputeWebSocketAccept(std::string_view key) {
  std::string concat;
  concat.reserve(key.size() + websocket::kGUID.size());
  concat.append(key);
  concat.append(websocket::kGUID);

  std::array<unsigned char, SHA_DIGEST_LENGTH> hash;
  SHA1(reinterpret_cast<const unsigned char*>(concat.data()), concat.size(), hash.data());

  // EVP_EncodeBlock writes a terminating null character.
  std::array<unsigned char, B64EncodedSha1{}.size() + 1> encoded;
  EVP_EncodeBlock(encoded.data(), hash.data(), static_cast<int>(hash.size()));

  B64EncodedSha1 ret;
  std::ranges::copy_n(encoded.begin(), static_cast<std::ptrdiff_t>(ret.size()), ret.begin());
  return ret;
}

UpgradeValidationResult ValidateWebSocketUpgrade(const HttpRequest& request) {
  UpgradeValidationResult result;

  if (!request.isWebSocketUpgrade()) {
    result.errorMessage = "Not a WebSocket upgrade request";
    return result;
  }

  const auto versionHeader = request.headerValue(http::SecWebSocketVersion);
  if (!versionHeader.has_value()) {
    result.errorMessage = "Missing Sec-WebSocket-Version header";
    return result;
  }
  if (Trim(*versionHeader, kOws) != websocket::kVersion) {
    result.errorMessage = "Unsupported Sec-WebSocket-Version (expected 13)";
    return result;
  }

  const auto keyHeader = request.headerValue(http::SecWebSocketKey);
  if (!keyHeader.has_value()) {
    result.errorMessage = "Missing Sec-WebSocket-Key header";
    return result;
  }
  const std::string_view key = Trim(*keyHeader, kOws);
  if (!IsValidWebSocketKey(key)) {
    result.errorMessage = "Invalid Sec-WebSocket-Key format";
    return result;
  }

  result.secWebSocketAccept = ComputeWebSocketAccept(key);
  for (std::string_view protocols : request.headers().getAll(http::SecWebSocketProtocol)) {
    for (std::string& protocol : ParseTokenList(protocols)) {
      result.offeredProtocols.push_back(std::move(protocol));
    }
  }
  result.valid = true;
  return result;
}

HttpResponse BuildWebSocketUpgradeResponse(const UpgradeValidationResult& validationResult,
                                           std::optional<std::string_view> subprotocol) {
  HttpResponse response(http::StatusCodeSwitchingProtocols);
  response.header(http::Upgrade, websocket::kUpgradeValue);
  response.header(http::Connection, "Upgrade");
  response.header(http::SecWebSocketAccept, std::string_view(validationResult.secWebSocketAccept.data(),
                                                             validationResult.secWebSocketAccept.size()));
  if (subprotocol.has_value()) {
    response.header(http::SecWebSocketProtocol, *subprotocol);
  }
  return response;
}

HttpResponse BuildWebSocketUpgradeRejection(const HttpRequest& request,
                                            const UpgradeValidationResult& validationResult) {
  const auto version = request.headerValue(http::SecWebSocketVersion);
  if (version.has_value() && Trim(*version, kOws) != websocket::kVersion) {
    HttpResponse response = HttpResponse::PlainText(std::string(validationResult.errorMessage),
                                                    http::StatusCodeUpgradeRequired);
    response.header(http::SecWebSocketVersion, websocket::kVersion);
    return response;
  }
  return HttpResponse::PlainText(std::string(validationResult.errorMessage), http::StatusCodeBadRequest);
}

}  // namespace ignyx

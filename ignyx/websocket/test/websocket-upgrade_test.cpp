#include "ignyx/websocket-upgrade.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string_view>

#include "ignyx/http-method.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/http-status-code.hpp"

namespace ignyx {
namespace {

constexpr std::string_view kSampleKey = "dGhlIHNhbXBsZSBub25jZQ==";

HttpRequest UpgradeRequest(std::string_view version = "13", std::string_view key = kSampleKey) {
  return HttpRequest::FromParts(http::Method::GET, "/ws",
                                {{"Host", "localhost"},
                                 {"Upgrade", "websocket"},
                                 {"Connection", "keep-alive, Upgrade"},
                                 {"Sec-WebSocket-Version", version},
                                 {"Sec-WebSocket-Key", key},
                                 {"Sec-WebSocket-Protocol", "chat, superchat"}});
}

}  // namespace

TEST(WebSocketUpgrade, AcceptKeyFromRfcSample) {
  const auto accept = ComputeWebSocketAccept(kSampleKey);
  EXPECT_EQ(std::string_view(accept.data(), accept.size()), "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

TEST(WebSocketUpgrade, KeyFormat) {
  EXPECT_TRUE(IsValidWebSocketKey(kSampleKey));
  EXPECT_FALSE(IsValidWebSocketKey(""));
  EXPECT_FALSE(IsValidWebSocketKey("dGhlIHNhbXBsZSBub25jZQ="));
  EXPECT_FALSE(IsValidWebSocketKey("dGhlIHNhbXBsZSBub25jZQ=a"));
  EXPECT_FALSE(IsValidWebSocketKey("dGhlIHNhbXBsZSBub25j!Q=="));
}

TEST(WebSocketUpgrade, ValidRequest) {
  const auto request = UpgradeRequest();
  const auto result = ValidateWebSocketUpgrade(request);
  ASSERT_TRUE(result.valid) << result.errorMessage;
  EXPECT_EQ(std::string_view(result.secWebSocketAccept.data(), result.secWebSocketAccept.size()),
            "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
  ASSERT_EQ(result.offeredProtocols.size(), 2U);
  EXPECT_EQ(result.offeredProtocols[0], "chat");
  EXPECT_EQ(result.offeredProtocols[1], "superchat");
}

TEST(WebSocketUpgrade, NotAnUpgrade) {
  const auto request = HttpRequest::FromParts(http::Method::GET, "/ws", {{"Sec-WebSocket-Version", "13"}});
  const auto result = ValidateWebSocketUpgrade(request);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.errorMessage, "Not a WebSocket upgrade request");

  const auto post = HttpRequest::FromParts(http::Method::POST, "/ws",
                                           {{"Upgrade", "websocket"}, {"Connection", "Upgrade"}});
  EXPECT_FALSE(ValidateWebSocketUpgrade(post).valid);
}

TEST(WebSocketUpgrade, InvalidKey) {
  const auto request = UpgradeRequest("13", "short");
  const auto result = ValidateWebSocketUpgrade(request);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.errorMessage, "Invalid Sec-WebSocket-Key format");

  const auto rejection = BuildWebSocketUpgradeRejection(request, result);
  EXPECT_EQ(rejection.status(), http::StatusCodeBadRequest);
}

TEST(WebSocketUpgrade, VersionMismatchAnswers426) {
  const auto request = UpgradeRequest("8");
  const auto result = ValidateWebSocketUpgrade(request);
  ASSERT_FALSE(result.valid);

  const auto rejection = BuildWebSocketUpgradeRejection(request, result);
  EXPECT_EQ(rejection.status(), http::StatusCodeUpgradeRequired);
  EXPECT_EQ(rejection.headerValue("Sec-WebSocket-Version"), std::optional<std::string_view>("13"));
}

TEST(WebSocketUpgrade, SwitchingProtocolsResponse) {
  const auto result = ValidateWebSocketUpgrade(UpgradeRequest());
  ASSERT_TRUE(result.valid);

  auto response = BuildWebSocketUpgradeResponse(result, std::nullopt);
  EXPECT_EQ(response.status(), http::StatusCodeSwitchingProtocols);
  EXPECT_EQ(response.headerValue("Upgrade"), std::optional<std::string_view>("websocket"));
  EXPECT_EQ(response.headerValue("Connection"), std::optional<std::string_view>("Upgrade"));
  EXPECT_EQ(response.headerValue("Sec-WebSocket-Accept"),
            std::optional<std::string_view>("s3pPLMBiTxaQ9kYGzzhZRbK+xOo="));
  EXPECT_FALSE(response.headerValue("Sec-WebSocket-Protocol").has_value());

  response = BuildWebSocketUpgradeResponse(result, "superchat");
  EXPECT_EQ(response.headerValue("Sec-WebSocket-Protocol"), std::optional<std::string_view>("superchat"));
}

}  // namespace ignyx

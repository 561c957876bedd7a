#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

#include "ignyx/app-config.hpp"
#include "ignyx/app.hpp"
#include "ignyx/errors.hpp"
#include "ignyx/handler-task.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/json.hpp"
#include "ignyx/test-server.hpp"
#include "ignyx/test-util.hpp"
#include "ignyx/websocket-config.hpp"
#include "ignyx/websocket-constants.hpp"
#include "ignyx/websocket-session.hpp"

using namespace std::chrono_literals;
using namespace ignyx;

namespace {

AppConfig TestAppConfig() { return AppConfig{}.withWorkerThreads(4).withOffloadThreads(1); }

HandlerTask<void> Echo(WebSocketSession& session) {
  session.accept();
  while (true) {
    WebSocketMessage message = co_await session.receive();
    if (message.binary) {
      session.sendBytes(std::as_bytes(std::span(message.data)));
    } else {
      session.sendText("echo: " + message.data);
    }
  }
}

uint16_t ClosePayloadCode(std::string_view payload) {
  if (payload.size() < 2) {
    return 0;
  }
  return static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8) | static_cast<uint8_t>(payload[1]));
}

}  // namespace

TEST(WebSocketServer, EchoTextAndBinary) {
  App app(TestAppConfig());
  app.websocket("/ws/echo", Echo);
  test::TestServer ts(app);

  test::WebSocketTestClient client(ts.port(), "/ws/echo");
  EXPECT_TRUE(client.handshakeResponse().contains("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n"));

  client.sendText("hello");
  auto frame = client.receive();
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->opcode, websocket::Opcode::Text);
  EXPECT_EQ(frame->payload, "echo: hello");

  client.sendBinary(std::string_view("\x00\x01\x02", 3));
  frame = client.receive();
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->opcode, websocket::Opcode::Binary);
  EXPECT_EQ(frame->payload, std::string_view("\x00\x01\x02", 3));

  // Fragmented message
  client.sendFrame(websocket::Opcode::Text, "frag", false);
  client.sendFrame(websocket::Opcode::Continuation, "ment");
  frame = client.receive();
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->payload, "echo: fragment");

  client.sendClose(1000, "bye");
  frame = client.receive();
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->opcode, websocket::Opcode::Close);
  EXPECT_EQ(ClosePayloadCode(frame->payload), 1000);
  EXPECT_TRUE(test::waitForPeerClose(client.fd()));
}

TEST(WebSocketServer, PingIsAnsweredWithPong) {
  App app(TestAppConfig());
  app.websocket("/ws/echo", Echo);
  test::TestServer ts(app);

  test::WebSocketTestClient client(ts.port(), "/ws/echo");
  client.sendFrame(websocket::Opcode::Ping, "are you there");
  const auto frame = client.receive();
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->opcode, websocket::Opcode::Pong);
  EXPECT_EQ(frame->payload, "are you there");
}

TEST(WebSocketServer, PathParametersAndSubprotocol) {
  App app(TestAppConfig());
  app.websocket("/rooms/{room}", [](WebSocketSession& session) -> HandlerTask<void> {
    session.accept("chat.v2");
    session.sendText(std::string(session.request().pathParamValue("room").value_or("?")));
    co_return;
  });
  test::TestServer ts(app);

  test::WebSocketTestClient client(ts.port(), "/rooms/lobby", {"chat.v1", "chat.v2"});
  EXPECT_TRUE(client.handshakeResponse().contains("Sec-WebSocket-Protocol: chat.v2\r\n"));
  auto frame = client.receive();
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->payload, "lobby");

  // Returning from the handler closes normally.
  frame = client.receive();
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->opcode, websocket::Opcode::Close);
  EXPECT_EQ(ClosePayloadCode(frame->payload), 1000);
}

TEST(WebSocketServer, JsonMessages) {
  App app(TestAppConfig());
  app.websocket("/ws/json", [](WebSocketSession& session) -> HandlerTask<void> {
    session.accept();
    Json request = co_await session.receiveJson();
    Json reply = JsonObject();
    reply["sum"] = request["a"].get<double>() + request["b"].get<double>();
    session.sendJson(reply);
  });
  test::TestServer ts(app);

  test::WebSocketTestClient client(ts.port(), "/ws/json");
  client.sendText(R"({"a":2,"b":40})");
  const auto frame = client.receive();
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->payload, R"({"sum":42})");
}

TEST(WebSocketServer, HandlerFailureAfterAcceptClosesWith1011) {
  App app(TestAppConfig());
  app.websocket("/ws/fail", [](WebSocketSession& session) -> HandlerTask<void> {
    session.accept();
    (void)co_await session.receive();
    throw std::runtime_error("boom");
  });
  test::TestServer ts(app);

  test::WebSocketTestClient client(ts.port(), "/ws/fail");
  client.sendText("trigger");
  const auto frame = client.receive();
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->opcode, websocket::Opcode::Close);
  EXPECT_EQ(ClosePayloadCode(frame->payload), 1011);
}

TEST(WebSocketServer, RefusedUpgrades) {
  App app(TestAppConfig());
  app.websocket("/ws/private", [](WebSocketSession& session) -> HandlerTask<void> {
    session.close();
    co_return;
  });
  app.websocket("/ws/missing", [](WebSocketSession&) -> HandlerTask<void> {
    throw HttpException(http::StatusCodeNotFound, "no such room");
    co_return;
  });
  test::TestServer ts(app);

  EXPECT_THROW(test::WebSocketTestClient(ts.port(), "/ws/private"), std::runtime_error);

  const auto refused = [&ts](std::string_view target, std::string_view version) {
    return test::requestOrThrow(ts.port(), {.target = std::string(target),
                                            .connection = "Upgrade",
                                            .headers = {{"Upgrade", "websocket"},
                                                        {"Sec-WebSocket-Key", "dGhlIHNhbXBsZSBub25jZQ=="},
                                                        {"Sec-WebSocket-Version", std::string(version)}}});
  };
  EXPECT_EQ(refused("/ws/private", "13").statusCode, 403);
  EXPECT_EQ(refused("/ws/missing", "13").statusCode, 404);

  const auto wrongVersion = refused("/ws/private", "8");
  EXPECT_EQ(wrongVersion.statusCode, 426);
  EXPECT_EQ(wrongVersion.headers.at("Sec-WebSocket-Version"), "13");
}

TEST(WebSocketServer, InvalidUtf8ClosesWith1007) {
  App app(TestAppConfig());
  app.websocket("/ws/echo", Echo);
  test::TestServer ts(app);

  test::WebSocketTestClient client(ts.port(), "/ws/echo");
  client.sendText("\xff\xfe");
  const auto frame = client.receive();
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->opcode, websocket::Opcode::Close);
  EXPECT_EQ(ClosePayloadCode(frame->payload), 1007);
  EXPECT_TRUE(test::waitForPeerClose(client.fd()));
}

TEST(WebSocketServer, ClientDisconnectEndsTheHandler) {
  App app(TestAppConfig());
  std::atomic<uint16_t> closeCode{0};
  app.websocket("/ws/watch", [&closeCode](WebSocketSession& session) -> HandlerTask<void> {
    session.accept();
    try {
      (void)co_await session.receive();
    } catch (const ConnectionClosed& ex) {
      closeCode = ex.closeCode();
    }
  });
  test::TestServer ts(app);

  {
    test::WebSocketTestClient client(ts.port(), "/ws/watch");
  }
  for (int attempt = 0; attempt < 200 && closeCode.load() == 0; ++attempt) {
    std::this_thread::sleep_for(5ms);
  }
  EXPECT_EQ(closeCode.load(), 1006);
}

TEST(WebSocketServer, ServerStopSendsGoingAway) {
  App app(TestAppConfig());
  app.websocket("/ws/echo", Echo);
  auto ts = std::make_unique<test::TestServer>(app);

  test::WebSocketTestClient client(ts->port(), "/ws/echo");
  std::jthread stopper([&ts] { ts->server.stop(); });
  const auto frame = client.receive();
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->opcode, websocket::Opcode::Close);
  EXPECT_EQ(ClosePayloadCode(frame->payload), 1001);
}

TEST(WebSocketServer, PlainRequestOnWebSocketRoute) {
  App app(TestAppConfig());
  app.websocket("/ws/echo", Echo);
  test::TestServer ts(app);

  const auto resp = test::requestOrThrow(ts.port(), {.target = "/ws/echo"});
  EXPECT_EQ(resp.statusCode, 404);
}

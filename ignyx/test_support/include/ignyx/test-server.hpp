#pragma once

#include <chrono>
#include <cstdint>

#include "ignyx/app.hpp"
#include "ignyx/http-server.hpp"
#include "ignyx/server-config.hpp"

namespace ignyx::test {

// Serves 'app' on an ephemeral port from background threads for the lifetime of the object.
class TestServer {
 public:
  explicit TestServer(App& app, ServerConfig cfg = {},
                      std::chrono::milliseconds pollPeriod = std::chrono::milliseconds{5});

  TestServer(const TestServer&) = delete;
  TestServer& operator=(const TestServer&) = delete;

  ~TestServer();

  [[nodiscard]] uint16_t port() const noexcept { return server.port(); }

  HttpServer server;
};

}  // namespace ignyx::test

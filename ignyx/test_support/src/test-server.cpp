#include "ignyx/test-server.hpp"

#include <chrono>
#include <utility>

#include "ignyx/app.hpp"
#include "ignyx/server-config.hpp"

namespace ignyx::test {

TestServer::TestServer(App& app, ServerConfig cfg, std::chrono::milliseconds pollPeriod)
    : server(app, std::move(cfg.withPollInterval(pollPeriod))) {
  server.start();
}

TestServer::~TestServer() { server.stop(); }

}  // namespace ignyx::test

#include "ignyx/server-config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

namespace ignyx {

TEST(ServerConfig, DefaultsAreValid) {
  ServerConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.port, 0);
  EXPECT_TRUE(config.enableKeepAlive);
}

TEST(ServerConfig, BuilderChain) {
  const ServerConfig config = ServerConfig{}
                                  .withPort(8080)
                                  .withReactorThreads(2)
                                  .withMaxHeaderBytes(4096)
                                  .withMaxBodyBytes(1024)
                                  .withKeepAliveTimeout(std::chrono::milliseconds{250});
  EXPECT_EQ(config.port, 8080);
  EXPECT_EQ(config.nbReactorThreads, 2U);
  EXPECT_EQ(config.maxHeaderBytes, 4096U);
  EXPECT_EQ(config.maxBodyBytes, 1024U);
  EXPECT_EQ(config.keepAliveTimeout, std::chrono::milliseconds{250});
}

TEST(ServerConfig, InvalidValues) {
  EXPECT_THROW(ServerConfig{}.withReactorThreads(0).validate(), std::invalid_argument);
  EXPECT_THROW(ServerConfig{}.withMaxHeaderBytes(16).validate(), std::invalid_argument);
  EXPECT_THROW(ServerConfig{}.withMaxOutboundBufferBytes(0).validate(), std::invalid_argument);
  EXPECT_THROW(ServerConfig{}.withMaxRequestsPerConnection(0).validate(), std::invalid_argument);
  EXPECT_THROW(ServerConfig{}.withKeepAliveTimeout(std::chrono::milliseconds{0}).validate(), std::invalid_argument);
  EXPECT_THROW(ServerConfig{}.withPollInterval(std::chrono::milliseconds{0}).validate(), std::invalid_argument);
  // The idle timeout is only checked with keep-alive enabled.
  EXPECT_NO_THROW(
      ServerConfig{}.withKeepAliveMode(false).withKeepAliveTimeout(std::chrono::milliseconds{0}).validate());
}

}  // namespace ignyx

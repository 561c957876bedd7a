#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "ignyx/dispatcher-config.hpp"
#include "ignyx/router-config.hpp"
#include "ignyx/websocket-config.hpp"

namespace ignyx {

struct AppConfig {
  // Value of the Server header. Empty to omit it.
  std::string serverName{"ignyx"};
  DispatcherConfig dispatcher;
  websocket::WebSocketConfig websocket;

  AppConfig& withServerName(std::string_view name) {
    serverName = name;
    return *this;
  }

  // Exception messages and chains are revealed in 500 responses.
  AppConfig& withDebug(bool enable = true) {
    dispatcher.withDebug(enable);
    return *this;
  }

  AppConfig& withWorkerThreads(uint32_t nb) {
    dispatcher.withWorkerThreads(nb);
    return *this;
  }

  AppConfig& withOffloadThreads(uint32_t nb) {
    dispatcher.withOffloadThreads(nb);
    return *this;
  }

  AppConfig& withCallLockTimeout(std::chrono::milliseconds timeout) {
    dispatcher.withCallLockTimeout(timeout);
    return *this;
  }

  AppConfig& withRouterConfig(RouterConfig config) {
    dispatcher.withRouterConfig(config);
    return *this;
  }

  AppConfig& withWebSocketConfig(websocket::WebSocketConfig config) {
    websocket = config;
    return *this;
  }

  // Throws std::invalid_argument for inconsistent values.
  void validate() const {
    dispatcher.validate();
    websocket.validate();
  }
};

}  // namespace ignyx

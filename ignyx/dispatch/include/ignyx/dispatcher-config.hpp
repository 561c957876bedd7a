#pragma once

#include <chrono>
#include <cstdint>

#include "ignyx/router-config.hpp"

namespace ignyx {

struct DispatcherConfig {
  // Threads executing requests (they mostly wait for the call-lock).
  uint32_t nbWorkerThreads{4};
  // Threads executing Offload() work, outside of the call-lock.
  uint32_t nbOffloadThreads{2};
  // Maximum wait for the call-lock before answering 503.
  std::chrono::milliseconds callLockTimeout{std::chrono::seconds{5}};
  // Reveals exception details in 500 responses.
  bool debug{false};
  RouterConfig routerConfig;

  DispatcherConfig& withWorkerThreads(uint32_t nb) {
    nbWorkerThreads = nb;
    return *this;
  }

  DispatcherConfig& withOffloadThreads(uint32_t nb) {
    nbOffloadThreads = nb;
    return *this;
  }

  DispatcherConfig& withCallLockTimeout(std::chrono::milliseconds timeout) {
    callLockTimeout = timeout;
    return *this;
  }

  DispatcherConfig& withDebug(bool enable = true) {
    debug = enable;
    return *this;
  }

  DispatcherConfig& withRouterConfig(RouterConfig config) {
    routerConfig = config;
    return *this;
  }

  // Throws std::invalid_argument for inconsistent values.
  void validate() const;
};

}  // namespace ignyx

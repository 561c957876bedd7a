#pragma once

#include <chrono>
#include <cstddef>

#include "ignyx/websocket-constants.hpp"

namespace ignyx::websocket {

struct WebSocketConfig {
  // Maximum size of a message after reassembly of its fragments. 0 means unlimited.
  std::size_t maxMessageSize{kDefaultMaxMessageSize};

  // Maximum payload size of a single frame. 0 means unlimited.
  std::size_t maxFrameSize{kDefaultMaxFrameSize};

  // How long to wait for the peer's Close after sending ours.
  std::chrono::milliseconds closeTimeout{std::chrono::milliseconds{5000}};

  // The connection stops reading while more than this many outbound bytes wait to be written,
  // or while more than this many inbound bytes wait to be received by the handler.
  std::size_t highWaterMark{1UL << 20};

  // Server side expects masked frames and sends unmasked ones.
  bool isServerSide{true};

  WebSocketConfig& withMaxMessageSize(std::size_t value) {
    maxMessageSize = value;
    return *this;
  }

  WebSocketConfig& withMaxFrameSize(std::size_t value) {
    maxFrameSize = value;
    return *this;
  }

  WebSocketConfig& withCloseTimeout(std::chrono::milliseconds value) {
    closeTimeout = value;
    return *this;
  }

  WebSocketConfig& withHighWaterMark(std::size_t value) {
    highWaterMark = value;
    return *this;
  }

  // Throws std::invalid_argument for inconsistent values.
  void validate() const;
};

}  // namespace ignyx::websocket

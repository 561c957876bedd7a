#include "ignyx/websocket-config.hpp"

#include <stdexcept>

namespace ignyx::websocket {

void WebSocketConfig::validate() const {
  if (maxFrameSize != 0 && maxMessageSize != 0 && maxFrameSize > maxMessageSize) {
    throw std::invalid_argument("WebSocket maxFrameSize cannot exceed maxMessageSize");
  }
  if (closeTimeout.count() <= 0) {
    throw std::invalid_argument("WebSocket closeTimeout must be strictly positive");
  }
  if (highWaterMark == 0) {
    throw std::invalid_argument("WebSocket highWaterMark must be strictly positive");
  }
}

}  // namespace ignyx::websocket

#include "ignyx/server-config.hpp"

#include <stdexcept>

namespace ignyx {

void ServerConfig::validate() const {
  if (nbReactorThreads == 0) {
    throw std::invalid_argument("nbReactorThreads should be strictly positive");
  }
  if (maxHeaderBytes < 128) {
    throw std::invalid_argument("maxHeaderBytes is too small to hold a request line");
  }
  if (maxOutboundBufferBytes == 0) {
    throw std::invalid_argument("maxOutboundBufferBytes should be strictly positive");
  }
  if (maxRequestsPerConnection == 0) {
    throw std::invalid_argument("maxRequestsPerConnection should be strictly positive");
  }
  if (enableKeepAlive && keepAliveTimeout.count() <= 0) {
    throw std::invalid_argument("keepAliveTimeout should be strictly positive when keep-alive is enabled");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval should be strictly positive");
  }
}

}  // namespace ignyx

#include "ignyx/dispatcher-config.hpp"

#include <chrono>
#include <stdexcept>

namespace ignyx {

void DispatcherConfig::validate() const {
  if (nbWorkerThreads == 0) {
    throw std::invalid_argument("nbWorkerThreads should be strictly positive");
  }
  if (nbOffloadThreads == 0) {
    throw std::invalid_argument("nbOffloadThreads should be strictly positive");
  }
  if (callLockTimeout <= std::chrono::milliseconds{0}) {
    throw std::invalid_argument("callLockTimeout should be strictly positive");
  }
}

}  // namespace ignyx

#pragma once

#include <cstdint>
#include <utility>

#include "ignyx/base-fd.hpp"

namespace ignyx {

// RAII TCP socket (IPv4).
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Throws std::system_error on failure.
  explicit Socket(Type type);

  // Adopts an already opened descriptor (typically from accept).
  explicit Socket(BaseFd baseFd) noexcept : _baseFd(std::move(baseFd)) {}

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Binds on all interfaces and listens. Port 0 picks an ephemeral port, written back to 'port'.
  // Throws std::system_error on failure.
  void bindAndListen(bool reusePort, uint16_t& port, int backlog);

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace ignyx

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace ignyx {

struct ServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // TCP port to bind. 0 (default) lets the OS pick an ephemeral free port, available from HttpServer::port()
  // once the server is constructed.
  uint16_t port{};
  // Enables SO_REUSEPORT so that other processes may bind the same port. Always enabled with several reactors,
  // each reactor owning its own listening socket.
  bool reusePort{false};
  // Number of reactor threads, each running its own event loop. Requests are executed by the application
  // worker pool, not by reactors.
  uint32_t nbReactorThreads{1};

  // ============================
  // Request parsing & body limits
  // ============================
  // Maximum size of the request head (request line + headers). Exceeding it yields 431 and closes the connection.
  std::size_t maxHeaderBytes{8192};
  // Maximum size of a request body, after decoding of chunked framing. Exceeding it yields 413.
  std::size_t maxBodyBytes{1 << 20};

  // =============================================
  // Outbound buffering & backpressure management
  // =============================================
  // Bytes queued but not yet written above which a streamed body is not pulled any further, and a WebSocket
  // connection stops being read, until the socket drains.
  std::size_t maxOutboundBufferBytes{4 << 20};

  // ===========================================
  // Keep-Alive / connection lifecycle controls
  // ===========================================
  uint32_t maxRequestsPerConnection{100};
  bool enableKeepAlive{true};
  // Idle time after which a keep-alive connection waiting for its next request is closed.
  std::chrono::milliseconds keepAliveTimeout{std::chrono::milliseconds{5000}};
  // Maximum blocking time of the event loop, which bounds the reactivity of stop() and of timeouts.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{200}};

  ServerConfig& withPort(uint16_t port) {
    this->port = port;
    return *this;
  }

  ServerConfig& withReusePort(bool on = true) {
    this->reusePort = on;
    return *this;
  }

  ServerConfig& withReactorThreads(uint32_t nbThreads) {
    this->nbReactorThreads = nbThreads;
    return *this;
  }

  ServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes) {
    this->maxHeaderBytes = maxHeaderBytes;
    return *this;
  }

  ServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes) {
    this->maxBodyBytes = maxBodyBytes;
    return *this;
  }

  ServerConfig& withMaxOutboundBufferBytes(std::size_t maxOutbound) {
    this->maxOutboundBufferBytes = maxOutbound;
    return *this;
  }

  ServerConfig& withMaxRequestsPerConnection(uint32_t maxRequests) {
    this->maxRequestsPerConnection = maxRequests;
    return *this;
  }

  ServerConfig& withKeepAliveMode(bool on = true) {
    this->enableKeepAlive = on;
    return *this;
  }

  ServerConfig& withKeepAliveTimeout(std::chrono::milliseconds timeout) {
    this->keepAliveTimeout = timeout;
    return *this;
  }

  ServerConfig& withPollInterval(std::chrono::milliseconds interval) {
    this->pollInterval = interval;
    return *this;
  }

  // Throws std::invalid_argument for inconsistent values.
  void validate() const;
};

}  // namespace ignyx

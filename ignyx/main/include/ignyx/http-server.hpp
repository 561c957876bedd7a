#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "ignyx/app.hpp"
#include "ignyx/server-config.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

class Reactor;

// Serves an App over HTTP/1.1 and WebSocket.
//
// Listening sockets are bound at construction, so port() is known (and connections are queued by the kernel)
// before the server runs. Each reactor thread owns an epoll loop and a listening socket (SO_REUSEPORT when
// several), request execution happens on the application worker pool.
//
// The App must outlive the server. Starting the server starts the App (freezing its registration), stopping it
// runs the App shutdown hooks.
class HttpServer {
 public:
  // Throws std::invalid_argument for an invalid config, std::system_error if a socket cannot be bound.
  HttpServer(App& app, ServerConfig config = {});

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Stops the server if running.
  ~HttpServer();

  // Blocks until stop() is called from another thread or a termination signal is received
  // (see SignalHandler::Enable). The first reactor runs on the calling thread.
  void run();

  // Starts serving on background threads and returns immediately.
  void start();

  // Requests all reactors to stop, closes connections (WebSocket ones with 1001) and waits for background
  // threads. Idempotent, safe to call from any thread.
  void stop() noexcept;

  [[nodiscard]] bool isRunning() const noexcept { return _running.load(std::memory_order_relaxed); }

  // Port the server listens on (the ephemeral one if configured with port 0).
  [[nodiscard]] uint16_t port() const noexcept { return _config.port; }

  [[nodiscard]] const ServerConfig& config() const noexcept { return _config; }

 private:
  void launch(std::size_t firstThreadedReactor);
  void joinAndShutdown() noexcept;

  App& _app;
  ServerConfig _config;
  vector<std::unique_ptr<Reactor>> _reactors;
  std::vector<std::jthread> _threads;
  std::mutex _lifecycleMutex;
  std::atomic<bool> _running{false};
  bool _foreground{false};
};

}  // namespace ignyx

#include "ignyx/http-server.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include "ignyx/log.hpp"
#include "reactor.hpp"

namespace ignyx {

HttpServer::HttpServer(App& app, ServerConfig config) : _app(app), _config(std::move(config)) {
  _config.validate();
  const bool reusePort = _config.reusePort || _config.nbReactorThreads > 1;
  _reactors.reserve(_config.nbReactorThreads);
  // The first reactor resolves an ephemeral port, the others bind the same one.
  for (uint32_t reactorIdx = 0; reactorIdx < _config.nbReactorThreads; ++reactorIdx) {
    _reactors.push_back(std::make_unique<Reactor>(_app, _config, reusePort, _config.port));
  }
  log::info("Server bound to port :{} with {} reactor(s)", _config.port, _reactors.size());
}

HttpServer::~HttpServer() { stop(); }

void HttpServer::launch(std::size_t firstThreadedReactor) {
  if (_running.load(std::memory_order_relaxed)) {
    throw std::logic_error("Server is already running");
  }
  _app.startup();
  for (auto& reactor : _reactors) {
    reactor->rearm();
  }
  _running.store(true, std::memory_order_relaxed);
  for (std::size_t reactorIdx = firstThreadedReactor; reactorIdx < _reactors.size(); ++reactorIdx) {
    _threads.emplace_back([this, reactor = _reactors[reactorIdx].get()] {
      try {
        reactor->run();
      } catch (const std::exception& ex) {
        log::critical("Reactor failure: {}", ex.what());
        for (auto& other : _reactors) {
          other->requestStop();
        }
      }
    });
  }
  log::info("Server running on port :{}", _config.port);
}

void HttpServer::run() {
  {
    std::lock_guard lock(_lifecycleMutex);
    launch(1);
    _foreground = true;
  }
  try {
    _reactors.front()->run();
  } catch (const std::exception& ex) {
    log::critical("Reactor failure: {}", ex.what());
    stop();
    std::lock_guard lock(_lifecycleMutex);
    _foreground = false;
    joinAndShutdown();
    throw;
  }
  // Leaving after a signal: the other reactors have seen it or are about to.
  for (auto& reactor : _reactors) {
    reactor->requestStop();
  }
  std::lock_guard lock(_lifecycleMutex);
  _foreground = false;
  joinAndShutdown();
}

void HttpServer::start() {
  std::lock_guard lock(_lifecycleMutex);
  launch(0);
}

void HttpServer::stop() noexcept {
  for (auto& reactor : _reactors) {
    reactor->requestStop();
  }
  std::lock_guard lock(_lifecycleMutex);
  if (_foreground) {
    // run() joins the other reactors once the calling thread leaves its loop.
    return;
  }
  joinAndShutdown();
}

void HttpServer::joinAndShutdown() noexcept {
  if (!_running.load(std::memory_order_relaxed)) {
    return;
  }
  for (auto& thread : _threads) {
    thread.join();
  }
  _threads.clear();
  _running.store(false, std::memory_order_relaxed);
  _app.shutdown();
  log::info("Server on port :{} stopped", _config.port);
}

}  // namespace ignyx

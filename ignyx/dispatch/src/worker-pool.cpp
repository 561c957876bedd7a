#include "ignyx/worker-pool.hpp"

#include <cstdint>
#include <exception>
#include <mutex>
#include <string_view>
#include <thread>
#include <utility>

#include "ignyx/log.hpp"

namespace ignyx {

WorkerPool::WorkerPool(uint32_t nbThreads, std::string_view name) : _name(name) {
  if (nbThreads == 0) {
    nbThreads = 1;
  }
  _threads.reserve(nbThreads);
  for (uint32_t threadPos = 0; threadPos < nbThreads; ++threadPos) {
    _threads.emplace_back([this] { loop(); });
  }
  log::debug("Worker pool '{}' started with {} thread(s)", _name, nbThreads);
}

WorkerPool::~WorkerPool() { stop(); }

bool WorkerPool::post(Job job) {
  {
    std::scoped_lock lock(_mutex);
    if (_stopping) {
      return false;
    }
    _jobs.push_back(std::move(job));
  }
  _cv.notify_one();
  return true;
}

void WorkerPool::stop() {
  {
    std::scoped_lock lock(_mutex);
    if (_stopping) {
      return;
    }
    _stopping = true;
  }
  _cv.notify_all();
  for (auto& thread : _threads) {
    if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
      thread.join();
    }
  }
  log::debug("Worker pool '{}' stopped", _name);
}

void WorkerPool::loop() {
  while (true) {
    Job job;
    {
      std::unique_lock lock(_mutex);
      _cv.wait(lock, [this] { return _stopping || !_jobs.empty(); });
      if (_jobs.empty()) {
        return;
      }
      job = std::move(_jobs.front());
      _jobs.pop_front();
    }
    try {
      job();
    } catch (const std::exception& ex) {
      log::error("Uncaught exception in worker pool '{}': {}", _name, ex.what());
    }
  }
}

}  // namespace ignyx

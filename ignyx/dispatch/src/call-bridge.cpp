#include "ignyx/call-bridge.hpp"

#include <chrono>
#include <coroutine>
#include <exception>
#include <memory>
#include <utility>

#include "ignyx/call-lock.hpp"
#include "ignyx/errors.hpp"
#include "ignyx/log.hpp"
#include "ignyx/suspension.hpp"

namespace ignyx {

std::exception_ptr CaptureUserException() noexcept {
  try {
    throw;
  } catch (const std::exception&) {
    return std::current_exception();
  } catch (...) {
    return std::make_exception_ptr(HandlerException("Handler raised an exception not deriving from std::exception"));
  }
}

CallLock::Guard CallBridge::acquire() {
  if (!_callLock.tryLockUntil(deadline())) {
    log::warn("Call-lock not acquired within {} ms",
              std::chrono::duration_cast<std::chrono::milliseconds>(_lockTimeout).count());
    throw LockTimeout("Call-lock acquisition timed out");
  }
  return CallLock::Guard(_callLock);
}

void CallBridge::drive(std::coroutine_handle<> task, TaskDriver::Callbacks callbacks, CallLock::Guard guard) {
  auto driver = std::make_shared<TaskDriver>(*this, task, std::move(callbacks));
  guard.release();
  driver->start();
}

void TaskDriver::start() { step(); }

void TaskDriver::step() {
  CallLock::Guard guard(_bridge.callLock());
  {
    SuspensionContext::Scope scope(*this);
    std::exchange(_next, {}).resume();
  }
  if (_top.done()) {
    try {
      _callbacks.onCompleted();
    } catch (const std::exception& ex) {
      log::error("Completion of a handler task failed: {}", ex.what());
    }
  }
}

TaskDriver::ResumeFn TaskDriver::prepareResume(std::coroutine_handle<> handle) {
  return [self = shared_from_this(), handle]() {
    if (!self->_bridge.workers().post([self, handle] { self->resumeFromWorker(handle); })) {
      // Shutting down: nobody will resume the task anymore.
      self->abandon(nullptr);
    }
  };
}

void TaskDriver::resumeFromWorker(std::coroutine_handle<> handle) {
  if (_callbacks.isCancelled && _callbacks.isCancelled()) {
    log::debug("Request cancelled while its handler was suspended");
    abandon(nullptr);
    return;
  }
  if (!_bridge.callLock().tryLockUntil(_bridge.deadline())) {
    log::warn("Call-lock not re-acquired within {} ms after a suspension",
              std::chrono::duration_cast<std::chrono::milliseconds>(_bridge.lockTimeout()).count());
    abandon(std::make_exception_ptr(LockTimeout("Call-lock re-acquisition timed out")));
    return;
  }
  _next = handle;
  step();
}

void TaskDriver::abandon(std::exception_ptr error) {
  try {
    _callbacks.onAbandoned(std::move(error));
  } catch (const std::exception& ex) {
    log::error("Abandon of a handler task failed: {}", ex.what());
  }
  // Destroying the frame runs user destructors: wait for the lock, whatever the deadline.
  _bridge.callLock().lock();
  CallLock::Guard guard(_bridge.callLock());
  _callbacks.onReleased();
}

WorkerPool& TaskDriver::offloadPool() { return _bridge.offloadPool(); }

TimerQueue& TaskDriver::timers() { return _bridge.timers(); }

}  // namespace ignyx

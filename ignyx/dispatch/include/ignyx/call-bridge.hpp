#pragma once

#include <coroutine>
#include <exception>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include "ignyx/call-lock.hpp"
#include "ignyx/suspension.hpp"
#include "ignyx/timedef.hpp"
#include "ignyx/timer-queue.hpp"
#include "ignyx/worker-pool.hpp"

namespace ignyx {

// To be called from a catch (...) block: returns the current exception if it derives from std::exception,
// otherwise a HandlerException standing for it.
[[nodiscard]] std::exception_ptr CaptureUserException() noexcept;

class CallBridge;

// Drives one suspending handler task: resumes it under the call-lock, releases the lock whenever the task
// suspends on an engine awaitable and re-acquires it (with the bridge deadline) when the awaitable completes.
class TaskDriver : public SuspensionContext, public std::enable_shared_from_this<TaskDriver> {
 public:
  struct Callbacks {
    // Called under the call-lock once the outermost task completed (normally or with an exception).
    std::function<void()> onCompleted;
    // Called without the call-lock when the task cannot be resumed: 'error' is a LockTimeout, or null if the
    // request was cancelled. Reports the outcome, the coroutine frame must be left alone.
    std::function<void(std::exception_ptr error)> onAbandoned;
    // Called under the call-lock after onAbandoned. The callee must destroy the coroutine frame.
    std::function<void()> onReleased;
    // Checked before each resumption.
    std::function<bool()> isCancelled;
  };

  TaskDriver(CallBridge& bridge, std::coroutine_handle<> task, Callbacks callbacks) noexcept
      : _bridge(bridge), _next(task), _top(task), _callbacks(std::move(callbacks)) {}

  // The call-lock must be held by the calling thread. Ownership of the lock is transferred to the driver, which
  // releases it before returning.
  void start();

  ResumeFn prepareResume(std::coroutine_handle<> handle) override;

  WorkerPool& offloadPool() override;

  TimerQueue& timers() override;

 private:
  // Resumes '_next' with the lock held, and releases it.
  void step();

  void resumeFromWorker(std::coroutine_handle<> handle);

  void abandon(std::exception_ptr error);

  CallBridge& _bridge;
  std::coroutine_handle<> _next;
  std::coroutine_handle<> _top;
  Callbacks _callbacks;
};

// Boundary between the engine and user code. Every user callable (handlers, hooks, dependency providers,
// background tasks) runs through it, under the process-wide call-lock.
class CallBridge {
 public:
  CallBridge(CallLock& callLock, WorkerPool& workers, WorkerPool& offloadPool, TimerQueue& timers,
             SteadyDuration lockTimeout) noexcept
      : _callLock(callLock),
        _workers(workers),
        _offloadPool(offloadPool),
        _timers(timers),
        _lockTimeout(lockTimeout) {}

  // Acquires the call-lock before the configured deadline, throws LockTimeout otherwise.
  [[nodiscard]] CallLock::Guard acquire();

  // Runs 'fn' under the call-lock. Exceptions propagate, non standard ones as HandlerException.
  template <class Fn>
  auto call(Fn&& fn) -> std::invoke_result_t<Fn&> {
    CallLock::Guard guard = acquire();
    try {
      return std::invoke(fn);
    } catch (...) {
      std::rethrow_exception(CaptureUserException());
    }
  }

  // Drives a suspending task. 'guard' must own the call-lock, it is taken over by the driver.
  void drive(std::coroutine_handle<> task, TaskDriver::Callbacks callbacks, CallLock::Guard guard);

  [[nodiscard]] CallLock& callLock() noexcept { return _callLock; }

  [[nodiscard]] WorkerPool& workers() noexcept { return _workers; }

  [[nodiscard]] WorkerPool& offloadPool() noexcept { return _offloadPool; }

  [[nodiscard]] TimerQueue& timers() noexcept { return _timers; }

  [[nodiscard]] SteadyDuration lockTimeout() const noexcept { return _lockTimeout; }

  [[nodiscard]] SteadyTimePoint deadline() const noexcept { return SteadyClock::now() + _lockTimeout; }

 private:
  CallLock& _callLock;
  WorkerPool& _workers;
  WorkerPool& _offloadPool;
  TimerQueue& _timers;
  SteadyDuration _lockTimeout;
};

}  // namespace ignyx

#pragma once

#include <coroutine>
#include <exception>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

#include "ignyx/timedef.hpp"

namespace ignyx {

class TimerQueue;
class WorkerPool;

// Engine side of a suspension point. Installed on the current thread while the engine resumes a handler task.
class SuspensionContext {
 public:
  using ResumeFn = std::function<void()>;

  virtual ~SuspensionContext() = default;

  // Called by an awaitable from await_suspend. The returned function must be called exactly once, from any
  // thread, when 'handle' can be resumed: the engine then re-acquires the call-lock and resumes it.
  virtual ResumeFn prepareResume(std::coroutine_handle<> handle) = 0;

  // Pool executing blocking work outside of the call-lock.
  virtual WorkerPool& offloadPool() = 0;

  virtual TimerQueue& timers() = 0;

  // Throws std::logic_error if no handler task is being driven on this thread.
  static SuspensionContext& Current();

  // Null when no handler task is being driven on this thread.
  static SuspensionContext* CurrentOrNull() noexcept;

  // Installs 'context' as the current one for the lifetime of the scope.
  class Scope {
   public:
    explicit Scope(SuspensionContext& context) noexcept;

    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

    ~Scope();

   private:
    SuspensionContext* _previous;
  };
};

namespace internal {

// Posts 'job' to the offload pool of the current context. Throws if the pool is stopped.
void PostOffload(SuspensionContext& context, std::function<void()> job);

void ScheduleTimer(SuspensionContext& context, SteadyTimePoint deadline, std::function<void()> callback);

}  // namespace internal

// Awaitable running 'fn' on the offload pool, outside of the call-lock, and resuming with its result.
// Exceptions thrown by 'fn' are rethrown at the co_await.
template <class Fn>
class Offload {
 public:
  using Result = std::invoke_result_t<Fn&>;

  explicit Offload(Fn fn) : _fn(std::move(fn)) {}

  [[nodiscard]] bool await_ready() const noexcept { return false; }

  void await_suspend(std::coroutine_handle<> handle) {
    SuspensionContext& context = SuspensionContext::Current();
    internal::PostOffload(context, [this, resume = context.prepareResume(handle)]() {
      try {
        if constexpr (std::is_void_v<Result>) {
          _fn();
        } else {
          _result.emplace(_fn());
        }
      } catch (...) {
        _exception = std::current_exception();
      }
      resume();
    });
  }

  Result await_resume() {
    if (_exception) {
      std::rethrow_exception(_exception);
    }
    if constexpr (!std::is_void_v<Result>) {
      return std::move(*_result);
    }
  }

 private:
  using Storage = std::conditional_t<std::is_void_v<Result>, bool, Result>;

  Fn _fn;
  std::optional<Storage> _result;
  std::exception_ptr _exception;
};

template <class Fn>
Offload(Fn) -> Offload<Fn>;

// Awaitable suspending the handler for 'duration' without holding the call-lock.
class SleepFor {
 public:
  explicit SleepFor(SteadyDuration duration) noexcept : _duration(duration) {}

  [[nodiscard]] bool await_ready() const noexcept { return false; }

  void await_suspend(std::coroutine_handle<> handle) {
    SuspensionContext& context = SuspensionContext::Current();
    internal::ScheduleTimer(context, SteadyClock::now() + _duration, context.prepareResume(handle));
  }

  void await_resume() const noexcept {}

 private:
  SteadyDuration _duration;
};

}  // namespace ignyx

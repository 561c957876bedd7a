#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace ignyx {

namespace internal {

struct HandlerPromiseBase {
  // Resumes the awaiting task when this one completes (symmetric transfer).
  struct FinalAwaiter {
    [[nodiscard]] bool await_ready() const noexcept { return false; }

    template <class Promise>
    std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> handle) noexcept {
      std::coroutine_handle<> continuation = handle.promise()._continuation;
      if (continuation) {
        return continuation;
      }
      return std::noop_coroutine();
    }

    void await_resume() const noexcept {}
  };

  std::suspend_always initial_suspend() noexcept { return {}; }
  FinalAwaiter final_suspend() noexcept { return {}; }

  void unhandled_exception() noexcept { _exception = std::current_exception(); }

  void rethrow_if_needed() const {
    if (_exception) {
      std::rethrow_exception(_exception);
    }
  }

  std::coroutine_handle<> _continuation;
  std::exception_ptr _exception;
};

}  // namespace internal

// Lazily started coroutine returned by suspending handlers.
// The engine drives the outermost task; nested tasks are simply co_awaited and run on the same logical call.
// Suspending on an engine awaitable (Offload, SleepFor, WebSocket receive) releases the call-lock until resumption.
template <class T>
class HandlerTask {
 public:
  struct promise_type : internal::HandlerPromiseBase {
    HandlerTask get_return_object() noexcept {
      return HandlerTask{std::coroutine_handle<promise_type>::from_promise(*this)};
    }

    template <class U>
      requires std::is_convertible_v<U&&, T>
    void return_value(U&& value) noexcept(std::is_nothrow_constructible_v<T, U&&>) {
      _value.emplace(std::forward<U>(value));
    }

    T consume_result() {
      rethrow_if_needed();
      return std::move(*_value);
    }

    std::optional<T> _value;
  };

  HandlerTask() noexcept = default;
  explicit HandlerTask(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  HandlerTask(HandlerTask&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  HandlerTask& operator=(HandlerTask&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  HandlerTask(const HandlerTask&) = delete;
  HandlerTask& operator=(const HandlerTask&) = delete;

  ~HandlerTask() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  [[nodiscard]] std::coroutine_handle<> handle() const noexcept { return _coro; }

  // Result of a completed task. Rethrows the exception that escaped the coroutine body.
  T result() { return _coro.promise().consume_result(); }

  // Drives a task that never suspends on an engine awaitable (unit tests, simple nested calls).
  T runSynchronously() {
    while (_coro && !_coro.done()) {
      _coro.resume();
    }
    return _coro.promise().consume_result();
  }

  void reset() noexcept {
    if (_coro) {
      _coro.destroy();
      _coro = {};
    }
  }

  auto operator co_await() && noexcept {
    struct Awaiter {
      std::coroutine_handle<promise_type> coro;

      [[nodiscard]] bool await_ready() const noexcept { return !coro || coro.done(); }

      std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept {
        coro.promise()._continuation = awaiting;
        return coro;
      }

      T await_resume() { return coro.promise().consume_result(); }
    };
    return Awaiter{_coro};
  }

 private:
  std::coroutine_handle<promise_type> _coro;
};

template <>
class HandlerTask<void> {
 public:
  struct promise_type : internal::HandlerPromiseBase {
    HandlerTask get_return_object() noexcept {
      return HandlerTask{std::coroutine_handle<promise_type>::from_promise(*this)};
    }

    void return_void() const noexcept {}
  };

  HandlerTask() noexcept = default;
  explicit HandlerTask(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  HandlerTask(HandlerTask&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  HandlerTask& operator=(HandlerTask&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  HandlerTask(const HandlerTask&) = delete;
  HandlerTask& operator=(const HandlerTask&) = delete;

  ~HandlerTask() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  [[nodiscard]] std::coroutine_handle<> handle() const noexcept { return _coro; }

  void result() const { _coro.promise().rethrow_if_needed(); }

  void runSynchronously() {
    while (_coro && !_coro.done()) {
      _coro.resume();
    }
    if (_coro) {
      _coro.promise().rethrow_if_needed();
    }
  }

  void reset() noexcept {
    if (_coro) {
      _coro.destroy();
      _coro = {};
    }
  }

  auto operator co_await() && noexcept {
    struct Awaiter {
      std::coroutine_handle<promise_type> coro;

      [[nodiscard]] bool await_ready() const noexcept { return !coro || coro.done(); }

      std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept {
        coro.promise()._continuation = awaiting;
        return coro;
      }

      void await_resume() const { coro.promise().rethrow_if_needed(); }
    };
    return Awaiter{_coro};
  }

 private:
  std::coroutine_handle<promise_type> _coro;
};

}  // namespace ignyx

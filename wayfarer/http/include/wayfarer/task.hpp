#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace wayfarer {

template <class T>
class Task;

namespace detail {

struct TaskPromiseBase {
  // Resumes the awaiting coroutine, if any, when this one completes (symmetric transfer).
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

  void rethrowIfFailed() const {
    if (_exception) {
      std::rethrow_exception(_exception);
    }
  }

  std::coroutine_handle<> _continuation;
  std::exception_ptr _exception;
};

template <class T>
struct TaskPromise : TaskPromiseBase {
  Task<T> get_return_object() noexcept;

  template <class U>
    requires std::is_convertible_v<U&&, T>
  void return_value(U&& value) {
    _value.emplace(std::forward<U>(value));
  }

  T take() {
    rethrowIfFailed();
    return std::move(*_value);
  }

  std::optional<T> _value;
};

template <>
struct TaskPromise<void> : TaskPromiseBase {
  Task<void> get_return_object() noexcept;

  void return_void() noexcept {}

  void take() const { rethrowIfFailed(); }
};

}  // namespace detail

// Lazily started coroutine producing a T.
// Nothing runs until the task is awaited by another coroutine, resumed by its owner or driven by
// runSynchronously(). Destroying a Task destroys its frame and all the frames it owns.
// Exceptions escaping the coroutine are stored and rethrown to the awaiter (or by runSynchronously()).
template <class T>
class Task {
 public:
  using promise_type = detail::TaskPromise<T>;
  using handle_type = std::coroutine_handle<promise_type>;

  Task() noexcept = default;

  explicit Task(handle_type handle) noexcept : _handle(handle) {}

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  Task(Task&& other) noexcept : _handle(std::exchange(other._handle, {})) {}

  Task& operator=(Task&& other) noexcept {
    if (this != &other) {
      reset();
      _handle = std::exchange(other._handle, {});
    }
    return *this;
  }

  ~Task() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_handle); }

  [[nodiscard]] bool done() const noexcept { return !_handle || _handle.done(); }

  // Starts or continues the coroutine until its next suspension point.
  // Used by asynchronous transports: they resume the task once and get back control at each pending write.
  void resume() {
    if (!done()) {
      _handle.resume();
    }
  }

  // Retrieves the result of a completed task, rethrowing its exception if it failed.
  T result() {
    if (!done()) {
      throw std::logic_error("Task result requested before completion");
    }
    return _handle.promise().take();
  }

  // Drives a task whose awaited operations all complete synchronously.
  // Throws std::logic_error if the coroutine is still suspended after being resumed
  // (it is waiting on an asynchronous operation and must be awaited instead).
  T runSynchronously() {
    if (!_handle) {
      throw std::logic_error("Cannot run an empty task");
    }
    resume();
    return result();
  }

  void reset() noexcept {
    if (_handle) {
      _handle.destroy();
      _handle = {};
    }
  }

  auto operator co_await() && noexcept {
    struct Awaiter {
      [[nodiscard]] bool await_ready() const noexcept { return !handle || handle.done(); }

      std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept {
        handle.promise()._continuation = awaiting;
        return handle;
      }

      T await_resume() {
        if (!handle) {
          throw std::logic_error("Awaiting an empty task");
        }
        return handle.promise().take();
      }

      handle_type handle;
    };
    return Awaiter{_handle};
  }

 private:
  handle_type _handle;
};

namespace detail {

template <class T>
Task<T> TaskPromise<T>::get_return_object() noexcept {
  return Task<T>{std::coroutine_handle<TaskPromise<T>>::from_promise(*this)};
}

inline Task<void> TaskPromise<void>::get_return_object() noexcept {
  return Task<void>{std::coroutine_handle<TaskPromise<void>>::from_promise(*this)};
}

}  // namespace detail

// Deferred write of a response (or of a part of it) to a ResponseSink.
using WriteTask = Task<void>;

}  // namespace wayfarer

#pragma once

#include <coroutine>
#include <cstddef>
#include <deque>
#include <exception>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace trellis {

template <class T>
class Task;

namespace detail {

struct TaskPromiseBase {
  // On completion, resumes the awaiting coroutine if any (symmetric transfer), otherwise returns to the resumer.
  struct FinalAwaiter {
    [[nodiscard]] bool await_ready() const noexcept { return false; }

    template <class Promise>
    std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> coro) noexcept {
      auto continuation = coro.promise()._continuation;
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

  void rethrowIfNeeded() const {
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

  void return_value(T value) noexcept(std::is_nothrow_move_constructible_v<T>) { _value.emplace(std::move(value)); }

  T consumeResult() {
    rethrowIfNeeded();
    return std::move(*_value);
  }

  std::optional<T> _value;
};

template <>
struct TaskPromise<void> : TaskPromiseBase {
  Task<void> get_return_object() noexcept;

  void return_void() const noexcept {}

  void consumeResult() const { rethrowIfNeeded(); }
};

}  // namespace detail

// Lazily started coroutine producing a T or an exception.
// A Task does nothing until it is awaited (or driven by SyncWait). Awaiting it starts the coroutine, and the awaiter
// is resumed once it completes. Exceptions escaping the coroutine body are stored and rethrown to the awaiter.
template <class T>
class Task {
 public:
  using promise_type = detail::TaskPromise<T>;
  using value_type = T;

  Task() noexcept = default;
  explicit Task(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  Task(Task&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  Task& operator=(Task&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  ~Task() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  // Starts (or continues) the coroutine until its next suspension point.
  void resume() {
    if (_coro && !_coro.done()) {
      _coro.resume();
    }
  }

  // Returns the produced value, or rethrows the stored exception. The task must be done.
  decltype(auto) result() {
    if (!_coro || !_coro.done()) {
      throw std::logic_error("Task::result called on a task that did not complete");
    }
    return _coro.promise().consumeResult();
  }

  [[nodiscard]] bool await_ready() const noexcept { return false; }

  std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) {
    if (!_coro) {
      throw std::logic_error("Awaiting an empty Task");
    }
    _coro.promise()._continuation = awaiting;
    return _coro;
  }

  decltype(auto) await_resume() { return _coro.promise().consumeResult(); }

  void reset() noexcept {
    if (_coro) {
      _coro.destroy();
      _coro = {};
    }
  }

 private:
  std::coroutine_handle<promise_type> _coro;
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

// Single threaded cooperative scheduler.
// A coroutine awaiting 'yield()' is suspended and queued, it is resumed by a later call to runOne() or run().
// Queued coroutines must stay alive until they are resumed.
class TaskQueue {
 public:
  class YieldAwaiter {
   public:
    explicit YieldAwaiter(TaskQueue& queue) noexcept : _queue(&queue) {}

    [[nodiscard]] bool await_ready() const noexcept { return false; }
    void await_suspend(std::coroutine_handle<> coro) { _queue->_ready.push_back(coro); }
    void await_resume() const noexcept {}

   private:
    TaskQueue* _queue;
  };

  TaskQueue() = default;
  TaskQueue(const TaskQueue&) = delete;
  TaskQueue& operator=(const TaskQueue&) = delete;

  [[nodiscard]] YieldAwaiter yield() noexcept { return YieldAwaiter{*this}; }

  // Resumes the oldest queued coroutine. Returns false if there was nothing to run.
  bool runOne() {
    if (_ready.empty()) {
      return false;
    }
    auto coro = _ready.front();
    _ready.pop_front();
    coro.resume();
    return true;
  }

  // Runs until the queue is empty, including coroutines queued while running.
  void run() {
    while (runOne()) {
    }
  }

  [[nodiscard]] bool empty() const noexcept { return _ready.empty(); }

  [[nodiscard]] std::size_t size() const noexcept { return _ready.size(); }

 private:
  std::deque<std::coroutine_handle<>> _ready;
};

// Starts 'task' and drives 'queue' until the task completes. Returns the task result or rethrows its exception.
// Throws std::logic_error if the task is still suspended while the queue has no more work.
template <class T>
T SyncWait(Task<T> task, TaskQueue& queue) {
  task.resume();
  while (!task.done()) {
    if (!queue.runOne()) {
      throw std::logic_error("SyncWait: task is suspended with no pending work");
    }
  }
  return task.result();
}

template <class T>
T SyncWait(Task<T> task) {
  TaskQueue queue;
  return SyncWait(std::move(task), queue);
}

}  // namespace trellis

#ifndef DUPLEXIO_DETAIL_RUN_TASK_HPP
#define DUPLEXIO_DETAIL_RUN_TASK_HPP

#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

#include <cppcoro/awaitable_traits.hpp>

namespace duplexio::detail {
template <typename T>
class run_task;

/// Root coroutine of io_context::run(). It has no continuation: once started
/// it is resumed by completions only and the loop polls done().
class run_promise_base {
 public:
  std::suspend_always initial_suspend() noexcept { return {}; }
  // stay suspended at the end so the frame (and the result) outlives the body
  std::suspend_always final_suspend() noexcept { return {}; }

  void unhandled_exception() noexcept { exception_ = std::current_exception(); }

 protected:
  void rethrow_if_failed() const {
    if (exception_) {
      std::rethrow_exception(exception_);
    }
  }

 private:
  std::exception_ptr exception_;
};

template <typename T>
class run_promise final : public run_promise_base {
 public:
  run_task<T> get_return_object() noexcept;

  template <typename U>
  void return_value(U &&value) {
    value_.emplace(std::forward<U>(value));
  }

  T take() {
    rethrow_if_failed();
    return std::move(*value_);
  }

 private:
  std::optional<T> value_;
};

template <>
class run_promise<void> final : public run_promise_base {
 public:
  run_task<void> get_return_object() noexcept;

  void return_void() noexcept {}

  void take() const { rethrow_if_failed(); }
};

template <typename T>
class [[nodiscard]] run_task {
 public:
  using promise_type = run_promise<T>;
  using handle_t = std::coroutine_handle<promise_type>;

  explicit run_task(handle_t handle) noexcept : handle_(handle) {}
  run_task(run_task &&rhs) noexcept : handle_(std::exchange(rhs.handle_, nullptr)) {}
  run_task(const run_task &) = delete;
  run_task &operator=(const run_task &) = delete;
  ~run_task() {
    if (handle_) {
      handle_.destroy();
    }
  }

  /// run the body until its first suspension
  void start() { handle_.resume(); }

  [[nodiscard]] bool done() const noexcept { return handle_.done(); }

  /// the result of a finished task, its exception rethrown
  T take() { return handle_.promise().take(); }

 private:
  handle_t handle_;
};

template <typename T>
run_task<T> run_promise<T>::get_return_object() noexcept {
  return run_task<T>{std::coroutine_handle<run_promise>::from_promise(*this)};
}

inline run_task<void> run_promise<void>::get_return_object() noexcept {
  return run_task<void>{std::coroutine_handle<run_promise>::from_promise(*this)};
}

/// what co_await yields, by value
template <typename Awaitable>
using run_result_t = std::remove_cvref_t<typename cppcoro::awaitable_traits<Awaitable &&>::await_result_t>;

template <typename Awaitable, typename Result = run_result_t<Awaitable>>
requires(!std::is_void_v<Result>) run_task<Result> make_run_task(Awaitable &&awaitable) {
  co_return co_await std::forward<Awaitable>(awaitable);
}

template <typename Awaitable, typename Result = run_result_t<Awaitable>>
requires std::is_void_v<Result> run_task<void> make_run_task(Awaitable &&awaitable) {
  co_await std::forward<Awaitable>(awaitable);
}
}  // namespace duplexio::detail

#endif  // DUPLEXIO_DETAIL_RUN_TASK_HPP

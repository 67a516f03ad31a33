#ifndef DUPLEXIO_READY_HPP
#define DUPLEXIO_READY_HPP

#include <coroutine>
#include <type_traits>
#include <utility>

namespace duplexio {
/// An awaitable that never suspends, co_await yields the stored value.
/// Lets a stream keep an awaitable signature for operations that finish inline
/// (e.g. flush() of an unbuffered writer).
template <typename T>
struct ready {
  T value;

  constexpr bool await_ready() const noexcept { return true; }
  void await_suspend(std::coroutine_handle<>) const noexcept {}
  T await_resume() noexcept(std::is_nothrow_move_constructible_v<T>) { return std::move(value); }
};

template <typename T>
ready(T) -> ready<T>;
}  // namespace duplexio

#endif  // DUPLEXIO_READY_HPP

#ifndef DUPLEXIO_STREAM_CONCEPTS_HPP
#define DUPLEXIO_STREAM_CONCEPTS_HPP

#include <concepts>
#include <cstddef>
#include <utility>

#include <cppcoro/is_awaitable.hpp>

namespace duplexio {
/// Every stream operation reports like a completion queue entry does:
/// a positive byte count, 0 for end of stream, -EAGAIN when it would block
/// and -errno for a failure. It either returns that int directly (a sync
/// stream) or an awaitable resuming with it (an async stream).

template <typename R>
concept readable = requires(R &r, void *buf, std::size_t n) {
  r.read_some(buf, n);
};

template <typename W>
concept writable = requires(W &w, const void *buf, std::size_t n) {
  w.write_some(buf, n);
  w.flush();
  w.close();
};

/// Peek into an internal buffer with fill_buf(), then drop the bytes
/// looked at with consume(n).
template <typename R>
concept buffered_readable = readable<R> && requires(R &r, std::size_t n) {
  r.fill_buf();
  { r.consume(n) } -> std::same_as<void>;
};

/// A copy is an independent duplicate that starts out in an equal state.
template <typename T>
concept duplicable = std::copy_constructible<T>;

namespace detail {
template <typename R>
using read_result_t = decltype(std::declval<R &>().read_some(std::declval<void *>(), std::size_t{}));

template <typename W>
using write_result_t = decltype(std::declval<W &>().write_some(std::declval<const void *>(), std::size_t{}));
}  // namespace detail

template <typename R>
concept sync_readable = readable<R> && std::integral<detail::read_result_t<R>>;

template <typename R>
concept async_readable = readable<R> && cppcoro::is_awaitable_v<detail::read_result_t<R>>;

template <typename W>
concept sync_writable = writable<W> && std::integral<detail::write_result_t<W>>;

template <typename W>
concept async_writable = writable<W> && cppcoro::is_awaitable_v<detail::write_result_t<W>>;

}  // namespace duplexio

#endif  // DUPLEXIO_STREAM_CONCEPTS_HPP

#ifndef DUPLEXIO_IO_AWAITABLE_HPP
#define DUPLEXIO_IO_AWAITABLE_HPP

#include <coroutine>
#include <cstdint>
#include <type_traits>

namespace duplexio {
class io_context;

namespace detail {
// encapsulated to io_uring user data as completion token
struct io_token {
  // result is a int value (same as system call)
  // https://github.com/axboe/liburing/issues/6
  // IO operations are clamped at 2G in Linux
  void resolve(int res) noexcept {
    result = res;
    continuation.resume();
  }

  std::coroutine_handle<> continuation;
  int result = 0;
};

static_assert(std::is_trivially_destructible_v<io_token>);

/// Everything needed to fill a sqe, see io_uring_prep_rw()
struct io_request {
  uint8_t opcode;
  int fd;
  const void *addr;
  unsigned len;
  uint64_t offset;
  // rw_flags/fsync_flags/... union, meaning depends on the opcode
  uint32_t op_flags;
  // IOSQE_*
  uint8_t iflags;
};
}  // namespace detail

/// A request to an io_context, co_await it to get the cqe result.
///
/// Nothing reaches the ring before co_await: the sqe is taken, filled and
/// tagged in await_suspend(), and submitted the next time the context waits.
/// An awaitable dropped without co_await never runs.
class io_awaitable {
 public:
  io_awaitable(io_context *ctx, const detail::io_request &req) noexcept : ctx_(ctx), req_(req) {}

  struct awaiter {
    io_context *ctx;
    detail::io_request req;
    detail::io_token token{};

    constexpr bool await_ready() const noexcept { return false; }

    /// \throw std::system_error when no sqe can be obtained
    void await_suspend(std::coroutine_handle<> continuation);

    constexpr int await_resume() const noexcept { return token.result; }
  };

  awaiter operator co_await() const noexcept { return awaiter{ctx_, req_}; }

 private:
  io_context *ctx_;
  detail::io_request req_;
};

}  // namespace duplexio

#endif  // DUPLEXIO_IO_AWAITABLE_HPP

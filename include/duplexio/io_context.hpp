// io_context.hpp
#ifndef DUPLEXIO_IO_CONTEXT_HPP
#define DUPLEXIO_IO_CONTEXT_HPP

#include <cstdint>
#include <utility>
#include <liburing.h>

#include "duplexio/duplexio_config.hpp"
#include "duplexio/io_awaitable.hpp"
#include "duplexio/detail/run_task.hpp"

namespace duplexio {
/// A single threaded io_uring event loop.
///
/// The methods below describe requests. Each returns an io_awaitable: the sqe
/// is filled when it is co_await'ed, submitted in batch the next time the loop
/// waits, and the awaiter is resumed from within handle_completions() with the
/// cqe result (>= 0 or -errno).
///
/// @note io_context is NOT thread safe, nor is liburing. Use one per thread.
class io_context {
 public:
  /// read/write at the current file position (pipes, ttys, sockets as well)
  static constexpr uint64_t k_current_offset = static_cast<uint64_t>(-1);

  /** Init the io_uring instance
   * @see io_uring_setup(2)
   * @param entries Maximum sqe can be gotten without submitting
   * @param flags flags used to init io_uring
   * @throw std::system_error when the kernel refuses (old kernel, seccomp, ulimit -l ...)
   */
  explicit io_context(unsigned entries = DUPLEXIO_URING_ENTRIES, uint32_t flags = 0);

  ~io_context() noexcept;

  // prepared io_awaitables keep pointers into the ring
  io_context(const io_context &) = delete;
  io_context &operator=(const io_context &) = delete;

 public:
  /** Read from a file descriptor at a given offset asynchronously
   * @see pread(2)
   * @see io_uring_enter(2) IORING_OP_READ
   * @param iflags IOSQE_* flags
   */
  io_awaitable read(int fd, void *buf, unsigned nbytes, uint64_t offset = k_current_offset, uint8_t iflags = 0);

  /** Write to a file descriptor at a given offset asynchronously
   * @see pwrite(2)
   * @see io_uring_enter(2) IORING_OP_WRITE
   */
  io_awaitable write(int fd, const void *buf, unsigned nbytes, uint64_t offset = k_current_offset,
                     uint8_t iflags = 0);

  /** @see fsync(2), IORING_OP_FSYNC */
  io_awaitable fsync(int fd, unsigned fsync_flags = 0, uint8_t iflags = 0);

  /** @see shutdown(2), IORING_OP_SHUTDOWN, sockets only */
  io_awaitable shutdown(int fd, int how, uint8_t iflags = 0);

  /** @see close(2), IORING_OP_CLOSE */
  io_awaitable close(int fd, uint8_t iflags = 0);

  /** A request that does nothing and completes with 0, IORING_OP_NOP */
  io_awaitable nop(uint8_t iflags = 0);

 public:
  /// submit everything prepared, block until at least `min_c` completions
  void wait_for_completions(unsigned min_c = 1);

  /// resume the awaiters of every available completion
  void handle_completions();

  /// Drive the loop until `awaitable` completes.
  /// \return whatever co_await awaitable yields (by value), exceptions rethrown
  template <typename AWAITABLE>
  auto run(AWAITABLE &&awaitable) -> detail::run_result_t<AWAITABLE> {
    auto task = detail::make_run_task(std::forward<AWAITABLE>(awaitable));
    task.start();
    while (!task.done()) {
      wait_for_completions();
      handle_completions();
    }
    return task.take();
  }

  [[nodiscard]] int ring_fd() const noexcept { return ring_.ring_fd; }

 private:
  friend struct io_awaitable::awaiter;

  io_awaitable make_awaitable(uint8_t opcode, int fd, const void *addr, unsigned len, uint64_t offset,
                              uint32_t op_flags, uint8_t iflags) noexcept {
    return io_awaitable{this, detail::io_request{opcode, fd, addr, len, offset, op_flags, iflags}};
  }

  /// fill a sqe for `req`, completions of it resolve `token`
  void prepare(const detail::io_request &req, detail::io_token *token);

  /// Get a sqe pointer that is never NULL, a full submission queue is
  /// flushed to the kernel first.
  [[nodiscard]] io_uring_sqe *get_sqe_safe();

  ::io_uring ring_{};
  unsigned cqe_count_ = 0;
};
}  // namespace duplexio

#endif  // DUPLEXIO_IO_CONTEXT_HPP

#ifndef DUPLEXIO_URING_STREAM_HPP
#define DUPLEXIO_URING_STREAM_HPP
#include <cstddef>
#include <utility>

#include "duplexio/detail/io_utils.hpp"
#include "duplexio/fd_stream.hpp"
#include "duplexio/io_context.hpp"

namespace duplexio {
/// Reads through an io_context, every read_some() is a co_await-able
/// IORING_OP_READ at the current file position.
/// The io_context must outlive the reader.
class uring_reader {
 public:
  uring_reader(io_context *ctx, file_descriptor fd) : ctx_(ctx), fd_(std::move(fd)) {}

  io_awaitable read_some(void *buf, std::size_t n) { return ctx_->read(fd_.fd(), buf, static_cast<unsigned>(detail::clamp_io_size(n))); }

  [[nodiscard]] int fd() const { return fd_.fd(); }

 private:
  io_context *ctx_;
  file_descriptor fd_;
};

/// Writes through an io_context. Writes are not buffered, flush() is a
/// drained nop: it completes with 0 once every request submitted before it
/// has completed.
class uring_writer {
 public:
  uring_writer(io_context *ctx, file_descriptor fd) : ctx_(ctx), fd_(std::move(fd)) {}

  io_awaitable write_some(const void *buf, std::size_t n) {
    return ctx_->write(fd_.fd(), buf, static_cast<unsigned>(detail::clamp_io_size(n)));
  }

  io_awaitable flush() { return ctx_->nop(IOSQE_IO_DRAIN); }

  /// IORING_OP_CLOSE for an owned fd, a borrowed one is only forgotten.
  /// An already closed writer completes with -EBADF.
  /// The writer gives up its fd right away, co_await the result or the fd leaks.
  io_awaitable close() {
    if (fd_.invalid() || fd_.owned()) {
      return ctx_->close(fd_.release());
    }
    fd_.release();
    return ctx_->nop();
  }

  [[nodiscard]] int fd() const { return fd_.fd(); }

 private:
  io_context *ctx_;
  file_descriptor fd_;
};

}  // namespace duplexio
#endif  // DUPLEXIO_URING_STREAM_HPP

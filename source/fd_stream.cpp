#include "duplexio/fd_stream.hpp"

#include <cerrno>
#include <utility>

#include "duplexio/detail/io_utils.hpp"
#include "duplexio/logging.hpp"

namespace duplexio {

file_descriptor::file_descriptor(const file_descriptor &rhs) {
  if (!rhs.invalid()) {
    fd_ = ::dup(rhs.fd_) | detail::panic_on_err("dup", true);
    LOG_TRACE("dup fd {} -> {}", rhs.fd_, fd_);
  }
}

file_descriptor &file_descriptor::operator=(const file_descriptor &rhs) {
  if (this != &rhs) {
    file_descriptor copy{rhs};
    *this = std::move(copy);
  }
  return *this;
}

file_descriptor &file_descriptor::operator=(file_descriptor &&rhs) noexcept {
  if (this != &rhs) {
    if (int res = close(); res < 0 && res != -EBADF) {
      LOG_WARN("close fd {} on reassignment failed: {}", fd_, -res);
    }
    fd_ = rhs.fd_;
    owned_ = rhs.owned_;
    rhs.make_invalid();
  }
  return *this;
}

file_descriptor::~file_descriptor() {
  if (!invalid()) {
    if (int res = close(); res < 0) {
      LOG_WARN("close fd on destruction failed: {}", -res);
    }
  }
}

int file_descriptor::close() {
  if (invalid()) {
    return -EBADF;
  }
  int fd = fd_;
  make_invalid();
  if (!owned_) {
    return 0;
  }
  LOG_TRACE("close fd {}", fd);
  // the fd is released even when close(2) reports an error, never retry it
  return ::close(fd) == 0 ? 0 : -errno;
}

int fd_reader::read_some(void *buf, std::size_t n) {
  while (true) {
    ssize_t ret = ::read(fd_.fd(), buf, n);
    if (ret >= 0) {
      return static_cast<int>(ret);
    }
    if (errno == EINTR) {
      continue;
    }
    int err = errno;
    LOG_DEBUG("read fd {} failed: {}", fd_.fd(), err);
    return -err;
  }
}

int fd_writer::write_some(const void *buf, std::size_t n) {
  while (true) {
    ssize_t ret = ::write(fd_.fd(), buf, n);
    if (ret >= 0) {
      return static_cast<int>(ret);
    }
    if (errno == EINTR) {
      continue;
    }
    int err = errno;
    LOG_DEBUG("write fd {} failed: {}", fd_.fd(), err);
    return -err;
  }
}

int fd_writer::flush() { return fd_.invalid() ? -EBADF : 0; }

int fd_writer::close() { return fd_.close(); }

}  // namespace duplexio

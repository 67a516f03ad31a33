#ifndef DUPLEXIO_FD_STREAM_HPP
#define DUPLEXIO_FD_STREAM_HPP
#include <cstddef>
#include <utility>
#include <unistd.h>

namespace duplexio {

/// RAII owner of a POSIX file descriptor.
/// A borrowed descriptor (stdin/stdout, or anything the caller keeps owning)
/// is never closed here. Copying dup(2)s the descriptor: the copy owns a new
/// fd which shares the open file description (offset, status flags) with
/// the original.
class file_descriptor {
 public:
  file_descriptor() = default;
  /// take ownership of `fd`
  explicit file_descriptor(int fd) : fd_(fd) {}
  static file_descriptor borrow(int fd) {
    file_descriptor f{fd};
    f.owned_ = false;
    return f;
  }

  /// throws std::system_error when dup(2) fails
  file_descriptor(const file_descriptor &rhs);
  file_descriptor &operator=(const file_descriptor &rhs);
  file_descriptor(file_descriptor &&rhs) noexcept : fd_(rhs.fd_), owned_(rhs.owned_) { rhs.make_invalid(); }
  file_descriptor &operator=(file_descriptor &&rhs) noexcept;
  ~file_descriptor();

  /// Close an owned descriptor, forget a borrowed one.
  /// \return 0 or -errno, -EBADF when already invalid
  int close();

  /// Give up the descriptor without closing it.
  /// \return the fd, whoever gets it decides about closing
  int release() {
    int fd = fd_;
    make_invalid();
    return fd;
  }

  [[nodiscard]] int fd() const { return fd_; }
  [[nodiscard]] bool invalid() const { return fd_ < 0; }
  [[nodiscard]] bool owned() const { return owned_; }

 private:
  void make_invalid() { fd_ = -1; }

  int fd_{-1};
  bool owned_{true};
};

/// Blocking reads with read(2), EINTR is retried.
class fd_reader {
 public:
  explicit fd_reader(file_descriptor fd) : fd_(std::move(fd)) {}

  int read_some(void *buf, std::size_t n);

  [[nodiscard]] int fd() const { return fd_.fd(); }

 private:
  file_descriptor fd_;
};

/// Blocking writes with write(2), EINTR is retried.
/// There is no user space buffer, so flush() has nothing to push.
class fd_writer {
 public:
  explicit fd_writer(file_descriptor fd) : fd_(std::move(fd)) {}

  int write_some(const void *buf, std::size_t n);
  int flush();
  int close();

  [[nodiscard]] int fd() const { return fd_.fd(); }

 private:
  file_descriptor fd_;
};

/// borrowed STDIN_FILENO
inline fd_reader stdin_reader() { return fd_reader{file_descriptor::borrow(STDIN_FILENO)}; }

/// borrowed STDOUT_FILENO
inline fd_writer stdout_writer() { return fd_writer{file_descriptor::borrow(STDOUT_FILENO)}; }

}  // namespace duplexio
#endif  // DUPLEXIO_FD_STREAM_HPP

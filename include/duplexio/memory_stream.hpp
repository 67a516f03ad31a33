#ifndef DUPLEXIO_MEMORY_STREAM_HPP
#define DUPLEXIO_MEMORY_STREAM_HPP

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "duplexio/detail/io_utils.hpp"

namespace duplexio {

/// A cursor over bytes owned in memory, read_some() returns 0 once
/// everything has been read. Also serves as its own read buffer, so
/// fill_buf() never fails and never copies.
class memory_reader {
 public:
  memory_reader() = default;
  explicit memory_reader(std::string data) : data_(std::move(data)) {}
  explicit memory_reader(std::string_view data) : data_(data) {}
  explicit memory_reader(const char *data) : data_(data) {}

  int read_some(void *buf, std::size_t n) {
    std::size_t len = std::min(detail::clamp_io_size(n), remaining());
    ::memcpy(buf, data_.data() + pos_, len);
    pos_ += len;
    return static_cast<int>(len);
  }

  [[nodiscard]] std::span<const char> fill_buf() const { return {data_.data() + pos_, remaining()}; }

  void consume(std::size_t n) { pos_ += std::min(n, remaining()); }

  [[nodiscard]] std::size_t position() const { return pos_; }
  [[nodiscard]] std::size_t remaining() const { return data_.size() - pos_; }

 private:
  std::string data_;
  std::size_t pos_{0};
};

/// Appends everything it is given to a string, until closed.
class memory_writer {
 public:
  memory_writer() = default;

  int write_some(const void *buf, std::size_t n) {
    if (closed_) {
      return -EPIPE;
    }
    std::size_t len = detail::clamp_io_size(n);
    data_.append(static_cast<const char *>(buf), len);
    return static_cast<int>(len);
  }

  int flush() { return closed_ ? -EPIPE : 0; }

  int close() {
    closed_ = true;
    return 0;
  }

  [[nodiscard]] const std::string &data() const { return data_; }
  [[nodiscard]] bool closed() const { return closed_; }

 private:
  std::string data_;
  bool closed_{false};
};

}  // namespace duplexio

#endif  // DUPLEXIO_MEMORY_STREAM_HPP

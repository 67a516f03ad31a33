#ifndef DUPLEXIO_BUFFERED_READER_HPP
#define DUPLEXIO_BUFFERED_READER_HPP
#include <algorithm>
#include <cstddef>
#include <cstring>
#include <span>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include <cppcoro/task.hpp>

#include "duplexio/duplexio_config.hpp"
#include "duplexio/detail/io_utils.hpp"
#include "duplexio/stream_concepts.hpp"

namespace duplexio {

/// Adds an in-memory read buffer to any reader, giving it fill_buf()/consume().
///
/// Works over sync and async readers alike: with a sync reader the operations
/// return directly, with an async one they return a task<> to co_await.
/// A read_some() that finds the buffer empty and asks for at least a whole
/// buffer worth of bytes goes straight to the inner reader.
template <typename Reader>
class buffered_reader {
 public:
  static constexpr std::size_t default_size = DUPLEXIO_BUFFER_DEFAULT_SIZE;

  /// \throw std::invalid_argument when `capacity` is 0
  explicit buffered_reader(Reader inner, std::size_t capacity = default_size)
      : inner_(std::move(inner)), buf_(checked_capacity(capacity)) {}

  int read_some(void *buf, std::size_t n) requires sync_readable<Reader> {
    if (pos_ == filled_) {
      if (n >= buf_.size()) {
        return inner_.read_some(buf, n);
      }
      int ret = inner_.read_some(buf_.data(), buf_.size());
      if (ret < 0) {
        return ret;
      }
      refilled(ret);
    }
    return copy_out(buf, n);
  }

  cppcoro::task<int> read_some(void *buf, std::size_t n) requires async_readable<Reader> {
    if (pos_ == filled_) {
      if (n >= buf_.size()) {
        co_return co_await inner_.read_some(buf, n);
      }
      int ret = co_await inner_.read_some(buf_.data(), buf_.size());
      if (ret < 0) {
        co_return ret;
      }
      refilled(ret);
    }
    co_return copy_out(buf, n);
  }

  /// Refill if everything buffered has been consumed.
  /// \return the unconsumed bytes, empty at end of stream
  /// \throw std::system_error when the inner reader fails (would-block included)
  std::span<const char> fill_buf() requires sync_readable<Reader> {
    if (pos_ == filled_) {
      int ret = inner_.read_some(buf_.data(), buf_.size());
      if (ret < 0) {
        throw std::system_error(detail::to_error_code(ret), "fill_buf");
      }
      refilled(ret);
    }
    return buffer();
  }

  cppcoro::task<std::span<const char>> fill_buf() requires async_readable<Reader> {
    if (pos_ == filled_) {
      int ret = co_await inner_.read_some(buf_.data(), buf_.size());
      if (ret < 0) {
        throw std::system_error(detail::to_error_code(ret), "fill_buf");
      }
      refilled(ret);
    }
    co_return buffer();
  }

  void consume(std::size_t n) { pos_ = std::min(pos_ + n, filled_); }

  /// what is buffered right now, without touching the inner reader
  [[nodiscard]] std::span<const char> buffer() const { return {buf_.data() + pos_, filled_ - pos_}; }
  [[nodiscard]] std::size_t capacity() const { return buf_.size(); }

  /// Unwrap, bytes still buffered are lost.
  Reader into_inner() && { return std::move(inner_); }

 private:
  static std::size_t checked_capacity(std::size_t capacity) {
    if (capacity == 0) {
      throw std::invalid_argument("buffered_reader: zero capacity");
    }
    return capacity;
  }

  void refilled(int ret) {
    pos_ = 0;
    filled_ = static_cast<std::size_t>(ret);
  }

  int copy_out(void *buf, std::size_t n) {
    std::size_t len = std::min(n, filled_ - pos_);
    ::memcpy(buf, buf_.data() + pos_, len);
    pos_ += len;
    return static_cast<int>(len);
  }

  Reader inner_;
  std::vector<char> buf_;
  std::size_t pos_{0};
  std::size_t filled_{0};
};

template <typename Reader>
buffered_reader(Reader) -> buffered_reader<Reader>;

}  // namespace duplexio

#endif  // DUPLEXIO_BUFFERED_READER_HPP

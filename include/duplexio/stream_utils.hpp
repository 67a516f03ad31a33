#ifndef DUPLEXIO_STREAM_UTILS_HPP
#define DUPLEXIO_STREAM_UTILS_HPP
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <span>
#include <string>
#include <system_error>
#include <utility>

#include <cppcoro/task.hpp>

#include "duplexio/duplexio_config.hpp"
#include "duplexio/detail/io_utils.hpp"
#include "duplexio/eof_error.hpp"
#include "duplexio/stream_concepts.hpp"

/// Helpers over any stream, duplexes included. Streams are passed by
/// pointer, the caller keeps them alive until the (possibly async) call ends.
/// Each helper comes twice: returning directly for sync streams and as a
/// task<> for async ones.
namespace duplexio {

namespace detail {
inline constexpr std::size_t k_read_chunk = DUPLEXIO_BUFFER_DEFAULT_SIZE;

/// append up to and including the first '\n' of `available`
/// \return bytes taken and whether the line is complete
inline std::pair<std::size_t, bool> take_line(std::span<const char> available, std::string *line) {
  const void *eol = ::memchr(available.data(), '\n', available.size());
  std::size_t used = eol == nullptr ? available.size() : static_cast<const char *>(eol) - available.data() + 1;
  line->append(available.data(), used);
  return {used, eol != nullptr};
}
}  // namespace detail

/// read until a lf line (\n) is appended to `line`, or the end of stream.
/// \return bytes appended (the '\n' included), 0 at end of stream
/// \throw std::system_error if the stream fails
template <typename Stream>
requires buffered_readable<Stream> && sync_readable<Stream>
std::size_t read_line(Stream *s, std::string *line) {
  std::size_t total = 0;
  while (true) {
    std::span<const char> available = s->fill_buf();
    if (available.empty()) {
      return total;
    }
    auto [used, done] = detail::take_line(available, line);
    s->consume(used);
    total += used;
    if (done) {
      return total;
    }
  }
}

template <typename Stream>
requires buffered_readable<Stream> && async_readable<Stream>
cppcoro::task<std::size_t> read_line(Stream *s, std::string *line) {
  std::size_t total = 0;
  while (true) {
    std::span<const char> available = co_await s->fill_buf();
    if (available.empty()) {
      co_return total;
    }
    auto [used, done] = detail::take_line(available, line);
    s->consume(used);
    total += used;
    if (done) {
      co_return total;
    }
  }
}

/// Read everything left until end of stream, appending to `out`.
/// \return bytes appended
/// \throw std::system_error if the stream fails, `out` keeps what was read
template <typename Stream>
requires sync_readable<Stream>
std::size_t read_to_end(Stream *s, std::string *out) {
  const std::size_t start = out->size();
  while (true) {
    const std::size_t old = out->size();
    out->resize(old + detail::k_read_chunk);
    int ret = s->read_some(out->data() + old, detail::k_read_chunk);
    if (ret < 0) {
      out->resize(old);
      throw std::system_error(detail::to_error_code(ret), "read_to_end");
    }
    out->resize(old + ret);
    if (ret == 0) {
      return out->size() - start;
    }
  }
}

template <typename Stream>
requires async_readable<Stream>
cppcoro::task<std::size_t> read_to_end(Stream *s, std::string *out) {
  const std::size_t start = out->size();
  while (true) {
    const std::size_t old = out->size();
    out->resize(old + detail::k_read_chunk);
    int ret = co_await s->read_some(out->data() + old, detail::k_read_chunk);
    if (ret < 0) {
      out->resize(old);
      throw std::system_error(detail::to_error_code(ret), "read_to_end");
    }
    out->resize(old + ret);
    if (ret == 0) {
      co_return out->size() - start;
    }
  }
}

/// Write all `n` bytes, short writes are continued.
/// A write accepting nothing is treated as an error (`duplexio::eof_error` is thrown)
/// \throw std::system_error if the stream fails
template <typename Stream>
requires sync_writable<Stream>
void write_all(Stream *s, const void *data, std::size_t n) {
  auto *p = static_cast<const char *>(data);
  while (n != 0) {
    int ret = s->write_some(p, n);
    if (ret == 0) {
      throw eof_error{};
    }
    if (ret == -EINTR) {
      continue;
    }
    if (ret < 0) {
      throw std::system_error(detail::to_error_code(ret), "write_all");
    }
    p += ret;
    n -= ret;
  }
}

template <typename Stream>
requires async_writable<Stream>
cppcoro::task<> write_all(Stream *s, const void *data, std::size_t n) {
  auto *p = static_cast<const char *>(data);
  while (n != 0) {
    int ret = co_await s->write_some(p, n);
    if (ret == 0) {
      throw eof_error{};
    }
    if (ret == -EINTR) {
      continue;
    }
    if (ret < 0) {
      throw std::system_error(detail::to_error_code(ret), "write_all");
    }
    p += ret;
    n -= ret;
  }
}

}  // namespace duplexio

#endif  // DUPLEXIO_STREAM_UTILS_HPP

/// A duplex glues a reader and a writer that come as two separate objects
/// (stdin + stdout, the two halves of a split connection, ...) into one
/// object which is both readable and writable.
#ifndef DUPLEXIO_DUPLEX_HPP
#define DUPLEXIO_DUPLEX_HPP

#include <cstddef>
#include <type_traits>
#include <utility>

#include "duplexio/stream_concepts.hpp"

namespace duplexio {

/// \brief
/// Combine a reader + writer into one stream.
///
/// Reads go to the reader, writes/flush/close go to the writer, each call maps
/// onto exactly one call of the wrapped object and its result (an int or an
/// awaitable) is handed back untouched. Nothing is buffered, retried or
/// translated here, and the two halves are never synchronized with each other.
///
/// fill_buf()/consume() only exist when the reader is buffered_readable,
/// duplicate() and copying only when both halves are duplicable.
///
/// \code
///   duplex stdio{buffered_reader{stdin_reader()}, stdout_writer()};
///   std::string line;
///   read_line(&stdio, &line);
///   write_all(&stdio, line.data(), line.size());
/// \endcode
template <typename Reader, typename Writer>
class duplex {
 public:
  using reader_type = Reader;
  using writer_type = Writer;

  duplex(Reader reader, Writer writer) noexcept(
      std::is_nothrow_move_constructible_v<Reader> && std::is_nothrow_move_constructible_v<Writer>)
      : reader_(std::move(reader)), writer_(std::move(writer)) {}

  duplex(duplex &&) = default;
  duplex &operator=(duplex &&) = default;
  // deleted unless both halves are copyable
  duplex(const duplex &) = default;
  duplex &operator=(const duplex &) = default;

  ~duplex() = default;

  /// Decompose into the original halves, the duplex is left moved-from.
  std::pair<Reader, Writer> into_inner() && { return {std::move(reader_), std::move(writer_)}; }

  decltype(auto) read_some(void *buf, std::size_t n) requires readable<Reader> {
    return reader_.read_some(buf, n);
  }

  decltype(auto) write_some(const void *buf, std::size_t n) requires writable<Writer> {
    return writer_.write_some(buf, n);
  }

  decltype(auto) flush() requires writable<Writer> { return writer_.flush(); }

  /// Close the write side, the reader is not affected.
  decltype(auto) close() requires writable<Writer> { return writer_.close(); }

  decltype(auto) fill_buf() requires buffered_readable<Reader> { return reader_.fill_buf(); }

  /// \param n must not exceed what the last fill_buf() exposed, same contract
  ///        as the reader's own consume().
  void consume(std::size_t n) requires buffered_readable<Reader> { reader_.consume(n); }

  /// A new duplex over duplicates of both halves, sharing whatever the halves'
  /// own copies share (e.g. the open file description of a dup'ed fd) and
  /// nothing else.
  duplex duplicate() const requires duplicable<Reader> && duplicable<Writer> { return duplex{*this}; }

 private:
  Reader reader_;
  Writer writer_;
};

template <typename Reader, typename Writer>
duplex(Reader, Writer) -> duplex<Reader, Writer>;

}  // namespace duplexio

#endif  // DUPLEXIO_DUPLEX_HPP

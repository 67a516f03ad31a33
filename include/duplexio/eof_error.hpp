// eof_error.hpp
#ifndef DUPLEXIO_EOF_ERROR_HPP
#define DUPLEXIO_EOF_ERROR_HPP
#include <stdexcept>

namespace duplexio {
/// Thrown by the helpers when a stream stops making progress before the
/// requested amount was transferred (a write accepting 0 bytes).
class eof_error : public std::runtime_error {
 public:
  eof_error() : std::runtime_error("encounter an EOF") {}
};
}  // namespace duplexio
#endif  // DUPLEXIO_EOF_ERROR_HPP

#ifndef DUPLEXIO_DETAIL_IO_UTILS_HPP
#define DUPLEXIO_DETAIL_IO_UTILS_HPP
#include <cerrno>
#include <climits>
#include <cstddef>
#include <string_view>
#include <system_error>

namespace duplexio::detail {

/// Throw a std::system_error built from `err`, prints a backtrace
/// to stderr first in debug builds.
[[noreturn]] void panic(std::string_view sv, int err);

struct panic_on_err {
  panic_on_err(std::string_view command, bool use_errno) : command(command), use_errno(use_errno) {}
  std::string_view command;
  bool use_errno;
};

/// `::dup(fd) | panic_on_err("dup", true);`
/// \param use_errno the call reports -1 and sets errno (a syscall), otherwise
///        the call returns -errno itself (liburing style)
inline int operator|(int ret, panic_on_err &&poe) {
  if (ret < 0) {
    if (poe.use_errno) {
      panic(poe.command, errno);
    } else if (ret != -ETIME) {
      panic(poe.command, -ret);
    }
  }
  return ret;
}

/// Results are ints, so one transfer moves at most INT_MAX bytes.
inline constexpr std::size_t clamp_io_size(std::size_t n) noexcept {
  return n < static_cast<std::size_t>(INT_MAX) ? n : static_cast<std::size_t>(INT_MAX);
}

/// negative result -> std::error_code
inline std::error_code to_error_code(int res) { return std::error_code{-res, std::system_category()}; }

}  // namespace duplexio::detail
#endif  // DUPLEXIO_DETAIL_IO_UTILS_HPP

/// front end of logging module
#ifndef DUPLEXIO_LOGGING_HPP
#define DUPLEXIO_LOGGING_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "duplexio/duplexio_config.hpp"

namespace duplexio {
enum log_level {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  ERROR = 4,
  FATAL = 5,
  LOG_LEVEL_CNT,
};

extern log_level LOG_LEVEL;

inline void set_log_level(log_level l) { LOG_LEVEL = l; }

inline bool SHOULD_EMIT(log_level exp) { return exp >= LOG_LEVEL; }

/// "trace", "DEBUG", "warn"... -> level, "off" silences everything
std::optional<log_level> parse_log_level(std::string_view name);

/// Read the level from the DUPLEXIO_LOG_LEVEL environment variable,
/// \return `fallback` when unset or unparsable
log_level log_level_from_env(log_level fallback = WARN);

/// This class is used to implicit convert a file name
/// to it's basename in compile time.
class file_name_converter {
 public:
  template <int N>
  file_name_converter(const char (&arr)[N]) : data_(arr), size_(N - 1) {  // NOLINT(google-explicit-constructor)
    const char *slash = strrchr(data_, '/');                              // builtin function
    if (slash) {
      data_ = slash + 1;
      size_ -= static_cast<int>(data_ - arr);
    }
  }

  explicit file_name_converter(const char *filename) : data_(filename) {
    const char *slash = strrchr(filename, '/');
    if (slash) {
      data_ = slash + 1;
    }
    size_ = static_cast<int>(strlen(data_));
  }
  file_name_converter() = default;

  [[nodiscard]] std::string_view view() const { return {data_, static_cast<size_t>(size_)}; }

  const char *data_{""};
  int size_{0};
};

using file_name_t = file_name_converter;
}  // namespace duplexio

namespace duplexio::detail {
struct log_entry {
 public:
  log_entry(file_name_t file, int line, log_level lv);
  log_entry() = default;
  file_name_t file_;
  int line_{0};
  log_level lv_{INFO};
  /// microseconds since epoch
  int64_t ts_{0};
  int tid_{0};
};
}  // namespace duplexio::detail

namespace duplexio {
// use in anonymous object
class logger {
 public:
  logger(file_name_t file, int line, log_level level = INFO);

  ~logger() = default;

  /// longer messages are cut
  static constexpr std::size_t k_max_message_size = 1024;

  /// receives the formatted message (without prefix) and its entry
  typedef void (*submit_interface)(std::string_view message, const detail::log_entry &) noexcept;

  /// Formats on the stack, nothing is allocated, so logging is fine in
  /// destructors and other noexcept paths.
  template <typename... Args>
  void log(fmt::format_string<Args...> fmt, Args &&...args) noexcept {
    char message[k_max_message_size];
    auto result = fmt::format_to_n(message, sizeof message, fmt, std::forward<Args>(args)...);
    submitter_(std::string_view{message, std::min(result.size, sizeof message)}, log_entry_);
  }

  static void register_submitter(submit_interface s) { submitter_ = s; }

  /// the default submitter, synchronous write to stderr
  static void stderr_submitter(std::string_view message, const detail::log_entry &e) noexcept;

  static const char *level_name(log_level lv) { return log_level_map_[lv]; }

 private:
  detail::log_entry log_entry_;

  const static char *log_level_map_[LOG_LEVEL_CNT];
  static submit_interface submitter_;
};
#define _DUPLEXIO_LOG_GEN_(level, fmt, ...)                          \
  if (duplexio::SHOULD_EMIT(level)) {                               \
    duplexio::logger(__FILE__, __LINE__, level).log(fmt, ##__VA_ARGS__); \
  } else

// macro notes:
// '#' is for cstring, '##' is for symbol
// notice that if ##__VA_ARGS__ is used,it must follow a ,
#define LOG_TRACE(fmt, ...) _DUPLEXIO_LOG_GEN_(duplexio::TRACE, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) _DUPLEXIO_LOG_GEN_(duplexio::DEBUG, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) _DUPLEXIO_LOG_GEN_(duplexio::INFO, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) _DUPLEXIO_LOG_GEN_(duplexio::WARN, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) _DUPLEXIO_LOG_GEN_(duplexio::ERROR, fmt, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) _DUPLEXIO_LOG_GEN_(duplexio::FATAL, fmt, ##__VA_ARGS__)
}  // namespace duplexio

#endif  // DUPLEXIO_LOGGING_HPP

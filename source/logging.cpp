#include "duplexio/logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <string>
#include <sys/syscall.h>
#include <unistd.h>

namespace duplexio {
log_level LOG_LEVEL = WARN;

logger::submit_interface logger::submitter_ = &logger::stderr_submitter;
// this must be completed in front end
const char *logger::log_level_map_[] = {"TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"};

namespace {
thread_local int t_cached_tid = 0;

int current_tid() {
  if (__builtin_expect(t_cached_tid == 0, 0)) {
    t_cached_tid = static_cast<int>(::syscall(SYS_gettid));
  }
  return t_cached_tid;
}
}  // namespace

logger::logger(file_name_t file, int line, log_level level) : log_entry_{file, line, level} {}

void logger::stderr_submitter(std::string_view message, const detail::log_entry &e) noexcept {
  auto secs = static_cast<time_t>(e.ts_ / 1000000);
  struct tm tm_time {};
  ::gmtime_r(&secs, &tm_time);

  // 20220502 13:01:44.123456 12345 INFO  message - file.cpp:42
  // prefix and suffix stay well below 256 bytes
  char line[k_max_message_size + 256];
  auto result = fmt::format_to_n(line, sizeof line, "{:04}{:02}{:02} {:02}:{:02}:{:02}.{:06} {:5} {} {} - {}:{}\n",
                 tm_time.tm_year + 1900, tm_time.tm_mon + 1, tm_time.tm_mday, tm_time.tm_hour, tm_time.tm_min,
                 tm_time.tm_sec, e.ts_ % 1000000, e.tid_, log_level_map_[e.lv_], message, e.file_.view(), e.line_);
  // one write per record, so lines from different threads won't interleave.
  // best effort, there is nowhere left to report a failure of stderr.
  [[maybe_unused]] ssize_t written = ::write(STDERR_FILENO, line, std::min(result.size, sizeof line));
}

std::optional<log_level> parse_log_level(std::string_view name) {
  std::string lowered{name};
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  if (lowered == "trace") return TRACE;
  if (lowered == "debug") return DEBUG;
  if (lowered == "info") return INFO;
  if (lowered == "warn" || lowered == "warning") return WARN;
  if (lowered == "error") return ERROR;
  if (lowered == "fatal") return FATAL;
  if (lowered == "off" || lowered == "none") return LOG_LEVEL_CNT;
  return std::nullopt;
}

log_level log_level_from_env(log_level fallback) {
  const char *value = std::getenv(DUPLEXIO_LOG_LEVEL_ENV);
  if (value == nullptr) {
    return fallback;
  }
  return parse_log_level(value).value_or(fallback);
}

}  // namespace duplexio

namespace duplexio::detail {
log_entry::log_entry(file_name_t file, int line, log_level lv)
    : file_(file),
      line_(line),
      lv_(lv),
      ts_{std::chrono::duration_cast<std::chrono::microseconds>(
              std::chrono::system_clock::now().time_since_epoch())
              .count()},
      tid_{current_tid()} {}
}  // namespace duplexio::detail

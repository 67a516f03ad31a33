#include "duplexio/detail/io_utils.hpp"
#include <cstdio>
#include <string>
#include <system_error>
#include <unistd.h>
#ifndef NDEBUG
#include <execinfo.h>
#endif

void duplexio::detail::panic(std::string_view sv, int err) {
#ifndef NDEBUG
  // https://stackoverflow.com/questions/77005/how-to-automatically-generate-a-stacktrace-when-my-program-crashes
  void *array[32];
  int size = backtrace(array, 32);

  fprintf(stderr, "Error: errno %d:\n", err);
  backtrace_symbols_fd(array, size, STDERR_FILENO);
#endif

  throw std::system_error(err, std::system_category(), std::string{sv});
}

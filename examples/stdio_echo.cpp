/// stdio_echo.cpp
/// Read a line from stdin and write it to stdout, both through the same
/// `stdio` duplex.
/// usage: echo hello | ./stdio_echo [lines: int]
/// DUPLEXIO_LOG_LEVEL=debug turns on the library logs.

#include <cstdlib>
#include <exception>
#include <string>

#include "duplexio/buffered_reader.hpp"
#include "duplexio/duplex.hpp"
#include "duplexio/fd_stream.hpp"
#include "duplexio/logging.hpp"
#include "duplexio/stream_utils.hpp"

using namespace duplexio;

int main(int argc, char *argv[]) {
  set_log_level(log_level_from_env());
  int lines = argc > 1 ? ::atoi(argv[1]) : 1;

  duplex stdio{buffered_reader{stdin_reader()}, stdout_writer()};
  try {
    std::string line;
    for (int i = 0; i < lines; i++) {
      line.clear();
      if (read_line(&stdio, &line) == 0) {
        LOG_INFO("stdin reaches EOF after {} lines", i);
        break;
      }
      write_all(&stdio, line.data(), line.size());
    }
    if (int ret = stdio.flush(); ret < 0) {
      LOG_ERROR("flush stdout failed: {}", -ret);
      return 1;
    }
  } catch (std::exception &e) {
    LOG_ERROR("{}", e.what());
    return 1;
  }
  return 0;
}

/// uring_stdio_echo.cpp
/// stdio_echo over io_uring: stdin and stdout are driven by an io_context
/// and the echo loop is a coroutine.
/// usage: printf 'a\nb\n' | ./uring_stdio_echo [lines: int]

#include <cstdlib>
#include <exception>
#include <string>
#include <unistd.h>

#include <cppcoro/task.hpp>

#include "duplexio/buffered_reader.hpp"
#include "duplexio/duplex.hpp"
#include "duplexio/io_context.hpp"
#include "duplexio/logging.hpp"
#include "duplexio/stream_utils.hpp"
#include "duplexio/uring_stream.hpp"

using namespace duplexio;

template <typename Stream>
cppcoro::task<int> echo_lines(Stream *stdio, int lines) {
  std::string line;
  int echoed = 0;
  for (; echoed < lines; echoed++) {
    line.clear();
    if (co_await read_line(stdio, &line) == 0) {
      break;
    }
    co_await write_all(stdio, line.data(), line.size());
  }
  co_await stdio->flush();
  co_return echoed;
}

int main(int argc, char *argv[]) {
  set_log_level(log_level_from_env());
  int lines = argc > 1 ? ::atoi(argv[1]) : 1;
  try {
    io_context ctx;
    duplex stdio{buffered_reader{uring_reader{&ctx, file_descriptor::borrow(STDIN_FILENO)}},
                 uring_writer{&ctx, file_descriptor::borrow(STDOUT_FILENO)}};
    int echoed = ctx.run(echo_lines(&stdio, lines));
    LOG_INFO("{} lines echoed", echoed);
  } catch (std::exception &e) {
    LOG_ERROR("{}", e.what());
    return 1;
  }
  return 0;
}

#include "duplexio/uring_stream.hpp"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <memory>
#include <string>
#include <system_error>
#include <vector>
#include <fcntl.h>
#include <cppcoro/task.hpp>
#include <cppcoro/when_all.hpp>
#include <gtest/gtest.h>
#include <unistd.h>

#include "duplexio/buffered_reader.hpp"
#include "duplexio/duplex.hpp"
#include "duplexio/io_context.hpp"
#include "duplexio/stream_utils.hpp"

using namespace duplexio;

static_assert(async_readable<uring_reader> && async_writable<uring_writer>);
static_assert(duplicable<uring_reader> && duplicable<uring_writer>);

using uring_duplex = duplex<buffered_reader<uring_reader>, uring_writer>;
static_assert(buffered_readable<uring_duplex> && async_writable<uring_duplex>);

class UringStream : public ::testing::Test {
 protected:
  void SetUp() override {
    try {
      ctx_ = std::make_unique<io_context>(8);
    } catch (std::system_error &e) {
      GTEST_SKIP() << "io_uring is not available here: " << e.what();
    }
    ASSERT_EQ(::pipe(pipe_.data()), 0);
  }

  void TearDown() override {
    for (int fd : pipe_) {
      if (fd >= 0) {
        ::close(fd);
      }
    }
  }

  /// hand the pipe over, the caller closes it from now on
  std::array<int, 2> take_pipe() {
    auto p = pipe_;
    pipe_ = {-1, -1};
    return p;
  }

  std::unique_ptr<io_context> ctx_;
  std::array<int, 2> pipe_{-1, -1};
};

namespace {
cppcoro::task<std::string> echo_once(uring_duplex *d, std::string message) {
  co_await write_all(d, message.data(), message.size());
  int ret = co_await d->flush();
  if (ret < 0) {
    throw std::system_error(detail::to_error_code(ret), "flush");
  }
  ret = co_await d->close();
  if (ret < 0) {
    throw std::system_error(detail::to_error_code(ret), "close");
  }
  std::string line;
  co_await read_line(d, &line);
  co_return line;
}

cppcoro::task<int> close_twice(uring_writer *w) {
  int first = co_await w->close();
  int second = co_await w->close();
  co_return first == 0 ? second : first;
}

cppcoro::task<int> one_nop(io_context *ctx) { co_return co_await ctx->nop(); }

cppcoro::task<int> read_after_closing(uring_duplex *d) {
  char c;
  co_await d->close();
  co_return co_await d->read_some(&c, 1);
}
}  // namespace

TEST_F(UringStream, RunReturnsTheResult) { EXPECT_EQ(ctx_->run(ctx_->nop()), 0); }

TEST_F(UringStream, PipeRoundTripThroughDuplex) {
  auto p = take_pipe();
  uring_duplex d{buffered_reader{uring_reader{ctx_.get(), file_descriptor{p[0]}}},
                 uring_writer{ctx_.get(), file_descriptor{p[1]}}};
  EXPECT_EQ(ctx_->run(echo_once(&d, "hello\n")), "hello\n");
  // the write end is closed, so the reader has reached the end
  EXPECT_EQ(ctx_->run(read_after_closing(&d)), 0);
}

TEST_F(UringStream, ClosingTwiceIsBadFd) {
  auto p = take_pipe();
  file_descriptor r{p[0]};
  uring_writer w{ctx_.get(), file_descriptor{p[1]}};
  EXPECT_EQ(ctx_->run(close_twice(&w)), -EBADF);
  EXPECT_EQ(::fcntl(p[1], F_GETFD), -1);
}

TEST_F(UringStream, BorrowedFdStaysOpen) {
  uring_writer w{ctx_.get(), file_descriptor::borrow(pipe_[1])};
  EXPECT_EQ(ctx_->run(w.close()), 0);
  EXPECT_NE(::fcntl(pipe_[1], F_GETFD), -1);
}

TEST_F(UringStream, DuplicateWritesToTheSamePipe) {
  auto p = take_pipe();
  uring_duplex d{buffered_reader{uring_reader{ctx_.get(), file_descriptor{p[0]}}},
                 uring_writer{ctx_.get(), file_descriptor{p[1]}}};
  auto copy = d.duplicate();
  EXPECT_EQ(ctx_->run(copy.write_some("dup", 3)), 3);
  auto available = ctx_->run(d.fill_buf());
  EXPECT_EQ(std::string(available.data(), available.size()), "dup");
}

TEST_F(UringStream, FsyncTempFile) {
  char name[] = "/tmp/duplexio_uring_XXXXXX";
  int fd = ::mkstemp(name);
  ASSERT_GE(fd, 0);
  ::unlink(name);
  uring_writer w{ctx_.get(), file_descriptor{fd}};
  EXPECT_EQ(ctx_->run(w.write_some("sync me", 7)), 7);
  EXPECT_EQ(ctx_->run(ctx_->fsync(w.fd())), 0);
}

TEST_F(UringStream, MoreRequestsInFlightThanEntries) {
  // the context has 8 entries, the 9th request flushes the submission queue
  std::vector<cppcoro::task<int>> tasks;
  for (int i = 0; i < 20; i++) {
    tasks.push_back(one_nop(ctx_.get()));
  }
  std::vector<int> results = ctx_->run(cppcoro::when_all(std::move(tasks)));
  ASSERT_EQ(results.size(), 20u);
  for (int res : results) {
    EXPECT_EQ(res, 0);
  }
}

TEST_F(UringStream, DroppedAwaitableNeverRuns) {
  {
    [[maybe_unused]] auto dropped = ctx_->write(pipe_[1], "x", 1);
  }
  EXPECT_EQ(ctx_->run(ctx_->nop()), 0);
  ASSERT_EQ(::fcntl(pipe_[0], F_SETFL, O_NONBLOCK), 0);
  char c;
  EXPECT_EQ(::read(pipe_[0], &c, 1), -1);
  EXPECT_EQ(errno, EAGAIN);
}

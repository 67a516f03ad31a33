#include "duplexio/stream_utils.hpp"

#include <cerrno>
#include <string>
#include <system_error>
#include <cppcoro/sync_wait.hpp>
#include <gtest/gtest.h>

#include "duplexio/buffered_reader.hpp"
#include "duplexio/memory_stream.hpp"
#include "scripted_stream.hpp"

using namespace duplexio;
using namespace duplexio::test;

TEST(ReadLine, SplitsOnNewlines) {
  memory_reader r{"one\ntwo\n\nlast"};
  std::string line;
  ASSERT_EQ(read_line(&r, &line), 4u);
  EXPECT_EQ(line, "one\n");
  // appends, like getline into a growing buffer
  ASSERT_EQ(read_line(&r, &line), 4u);
  EXPECT_EQ(line, "one\ntwo\n");
  line.clear();
  ASSERT_EQ(read_line(&r, &line), 1u);
  EXPECT_EQ(line, "\n");
  line.clear();
  ASSERT_EQ(read_line(&r, &line), 4u);
  EXPECT_EQ(line, "last");
  line.clear();
  EXPECT_EQ(read_line(&r, &line), 0u);
  EXPECT_TRUE(line.empty());
}

TEST(ReadLine, LineAcrossSeveralRefills) {
  script s{.input = "a long line\nrest"};
  buffered_reader r{scripted_reader{&s}, 4};
  std::string line;
  ASSERT_EQ(read_line(&r, &line), 12u);
  EXPECT_EQ(line, "a long line\n");
  EXPECT_EQ(s.reads, 3);
  // the newline ended the third refill, nothing is left buffered
  EXPECT_TRUE(r.buffer().empty());
  line.clear();
  ASSERT_EQ(read_line(&r, &line), 4u);
  EXPECT_EQ(line, "rest");
}

TEST(ReadLine, FailureThrows) {
  script s{.input = "partial", .read_results = {3, -EIO}};
  buffered_reader r{scripted_reader{&s}};
  std::string line;
  EXPECT_THROW(read_line(&r, &line), std::system_error);
  // bytes read before the failure are kept
  EXPECT_EQ(line, "par");
}

TEST(ReadToEnd, CollectsEverything) {
  std::string big(3 * DUPLEXIO_BUFFER_DEFAULT_SIZE + 17, 'x');
  memory_reader r{big};
  std::string out = "prefix";
  EXPECT_EQ(read_to_end(&r, &out), big.size());
  EXPECT_EQ(out, "prefix" + big);
}

TEST(ReadToEnd, FailureKeepsWhatWasRead) {
  script s{.input = "abcdef", .read_results = {2, -ECONNRESET}};
  scripted_reader r{&s};
  std::string out;
  try {
    read_to_end(&r, &out);
    FAIL() << "read_to_end should throw";
  } catch (std::system_error &e) {
    EXPECT_EQ(e.code().value(), ECONNRESET);
  }
  EXPECT_EQ(out, "ab");
}

TEST(WriteAll, ContinuesShortWrites) {
  script s{.write_results = {1, -EINTR, 2, 3}};
  scripted_writer w{&s};
  write_all(&w, "abcdefgh", 8);
  EXPECT_EQ(s.output, "abcdefgh");
  // 1 + retried EINTR + 2 + 3 + the rest at once
  EXPECT_EQ(s.writes, 5);
}

TEST(WriteAll, ZeroProgressIsEof) {
  script s{.write_results = {2, 0}};
  scripted_writer w{&s};
  EXPECT_THROW(write_all(&w, "abcd", 4), eof_error);
  EXPECT_EQ(s.output, "ab");
}

TEST(WriteAll, NothingToWrite) {
  script s;
  scripted_writer w{&s};
  write_all(&w, "", 0);
  EXPECT_EQ(s.writes, 0);
}

TEST(AsyncHelpers, LineAndWrite) {
  script s{.input = "x\ny", .read_results = {1, 1, 1}, .write_results = {1, -EINTR}};
  buffered_reader r{async_scripted_reader{&s}};
  async_scripted_writer w{&s};
  std::string line;
  ASSERT_EQ(cppcoro::sync_wait(read_line(&r, &line)), 2u);
  EXPECT_EQ(line, "x\n");
  cppcoro::sync_wait(write_all(&w, line.data(), line.size()));
  EXPECT_EQ(s.output, "x\n");

  std::string rest;
  EXPECT_EQ(cppcoro::sync_wait(read_to_end(&r, &rest)), 1u);
  EXPECT_EQ(rest, "y");
}

TEST(AsyncHelpers, WriteFailureThrows) {
  script s{.write_results = {-EPIPE}};
  async_scripted_writer w{&s};
  EXPECT_THROW(cppcoro::sync_wait(write_all(&w, "a", 1)), std::system_error);
  EXPECT_EQ(s.writes, 1);
}

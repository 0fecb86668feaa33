/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <unistd.h>

#include <folly/Exception.h>
#include <folly/File.h>
#include <folly/io/async/EventBase.h>
#include <folly/Random.h>

#include "meganode/processes/AsyncReadPipe.h"

using namespace meganode;

namespace {

void makePipe(folly::File* read_pipe, folly::File* write_pipe) {
  int pipe_fds[2];
  folly::checkUnixError(pipe(pipe_fds), "pipe");
  *write_pipe = folly::File(pipe_fds[1], /*owns_fd=*/ true);
  *read_pipe = folly::File(pipe_fds[0], /*owns_fd=*/ true);
}

}  // anonymous namespace

/**
 * Writes the message to a pipe in randomly sized chunks, randomly
 * alternating between reading and writing.
 *
 * Checks that every line except the last ends with exactly one delimiter,
 * that the last one has none, and that the lines reconstruct the message.
 */
void checkPipeRead(const std::string& message) {
  folly::File read_pipe, write_pipe;
  makePipe(&read_pipe, &write_pipe);

  size_t cursor = 0;
  auto write_chunk_fn = [&]() {
    auto bytes_left = message.size() - cursor;
    if (!bytes_left) {
      write_pipe.close();  // idempotent
      return;
    }
    auto to_write = folly::Random::rand32(1, bytes_left + 1);
    auto written =
      folly::writeNoInt(write_pipe.fd(), message.data() + cursor, to_write);
    folly::checkUnixError(written, "write");
    cursor += written;
  };

  folly::EventBase evb;
  bool saw_eof = false;
  std::string read_message;
  auto closed = asyncReadLines(
    &evb,
    std::move(read_pipe),
    [&](folly::StringPiece s) {
      EXPECT_FALSE(saw_eof);
      read_message.append(s.begin(), s.end());
      if (s.empty() || s.back() != '\n') {
        EXPECT_EQ(std::string::npos, folly::qfind(s, '\n'));
        saw_eof = true;
      } else {
        EXPECT_EQ(s.size() - 1, folly::qfind(s, '\n'));
      }
    }
  );

  while (!closed.isReady()) {
    if (folly::Random::oneIn(2)) {
      write_chunk_fn();
    }
    if (folly::Random::oneIn(2)) {
      evb.loopOnce(EVLOOP_NONBLOCK);
    }
  }
  EXPECT_FALSE(std::move(closed).getTry().hasException());
  EXPECT_TRUE(saw_eof);
  EXPECT_EQ(message, read_message);
}

TEST(TestAsyncReadLines, RandomChunks) {
  checkPipeRead("");
  checkPipeRead("ready\n");
  checkPipeRead("no newline at the end");
  checkPipeRead("ready\nsyncing\n\nsynced\nshutting down");
  checkPipeRead(std::string(5000, 'x') + "\n" + std::string(3000, 'y'));
}

TEST(TestAsyncReadLines, ThrowingCallbackClosesThePipe) {
  folly::File read_pipe, write_pipe;
  makePipe(&read_pipe, &write_pipe);
  folly::EventBase evb;
  size_t num_lines = 0;
  auto closed = asyncReadLines(
    &evb,
    std::move(read_pipe),
    [&](folly::StringPiece) {
      ++num_lines;
      throw std::runtime_error("bad line");
    }
  );
  std::string line = "first\nsecond\n";
  ASSERT_EQ(
    ssize_t(line.size()), folly::writeFull(write_pipe.fd(), line.data(), line.size())
  );
  while (!closed.isReady()) { evb.loopOnce(); }
  EXPECT_EQ(1, num_lines);
  EXPECT_TRUE(std::move(closed).getTry().hasException());
}

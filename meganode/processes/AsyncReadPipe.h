/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <fcntl.h>
#include <memory>

#include <folly/Exception.h>
#include <folly/File.h>
#include <folly/FileUtil.h>
#include <folly/futures/Future.h>
#include <folly/futures/Promise.h>
#include <folly/gen/String.h>
#include <folly/io/async/EventHandler.h>
#include <glog/logging.h>

namespace meganode {

namespace detail { template <typename LineCob> class AsyncReadLines; }

/**
 * Reads delimiter-separated lines from the read end of a pipe, via an
 * EventBase.  MUST be called from the EventBase thread.  Regular files are
 * not supported.
 *
 * `line_cob` runs in the EventBase thread as `void(folly::StringPiece)`.
 * Lines keep their delimiter, except for the final piece of the stream,
 * which is empty if the stream ended on a delimiter.  Lines longer than
 * `max_line_length` (0 means unlimited) arrive in several chunks.
 *
 * The future is ready once the other end closes the pipe.  It yields an
 * exception if reading fails, or if `line_cob` throws, in which case the
 * pipe is closed early.
 */
template <typename LineCob>
folly::Future<folly::Unit> asyncReadLines(
    folly::EventBase* evb,
    folly::File pipe,
    LineCob line_cob,
    uint64_t max_line_length = 0,
    char delimiter = '\n') {
  // Self-owned: deletes itself once the pipe is closed.
  auto* p = new detail::AsyncReadLines<LineCob>(
    std::move(pipe), std::move(line_cob), max_line_length, delimiter
  );
  return p->start(evb);
}

namespace detail {

template <typename LineCob>
class AsyncReadLines : public folly::EventHandler {
public:
  AsyncReadLines(
    folly::File pipe,
    LineCob line_cob,
    uint64_t max_line_length,
    char delimiter
  ) : pipe_(std::move(pipe)),
      splitter_(delimiter, SplitCob{std::move(line_cob)}, max_line_length) {}

  folly::Future<folly::Unit> start(folly::EventBase* evb) {
    auto f = closed_.getFuture();
    try {
      // We assume that as the reader, we are the sole owner of the FD.
      int fd = pipe_.fd();
      int flags = ::fcntl(fd, F_GETFL);
      folly::checkUnixError(flags, "fcntl get flags");
      folly::checkUnixError(
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK), "fcntl set flags"
      );
      initHandler(evb, folly::NetworkSocket::fromFd(fd));
      CHECK(registerHandler(EventHandler::READ | EventHandler::PERSIST));
    } catch (const std::exception&) {
      finish(folly::exception_wrapper{std::current_exception()});
    }
    return f;
  }

  void handlerReady(uint16_t events) noexcept override {
    CHECK(events & EventHandler::READ);
    try {
      char buf[kBufSize];
      while (true) {
        ssize_t ret = folly::readNoInt(pipe_.fd(), buf, kBufSize);
        if (ret == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
          return;  // Wait for more data
        }
        folly::checkUnixError(ret, "read");
        if (ret == 0) {
          splitter_.flush();
          finish(folly::exception_wrapper());
          return;
        }
        splitter_(folly::StringPiece(buf, ret));
      }
    } catch (const std::exception&) {
      finish(folly::exception_wrapper{std::current_exception()});
    }
  }

private:
  enum { kBufSize = 1024 };

  struct SplitCob {
    bool operator()(folly::StringPiece s) {
      cob_(s);
      return true;
    }
    LineCob cob_;
  };

  // Runs at most once, and is the last thing this object does.
  void finish(folly::exception_wrapper ew) noexcept {
    unregisterHandler();
    try {
      pipe_.close();
    } catch (const std::exception& ex) {
      LOG(ERROR) << "Failed to close pipe: " << ex.what();
    }
    if (ew) {
      closed_.setException(std::move(ew));
    } else {
      closed_.setValue();
    }
    delete this;
  }

  folly::File pipe_;
  folly::gen::StreamSplitter<SplitCob> splitter_;
  folly::Promise<folly::Unit> closed_;
};

}  // namespace detail

}  // namespace meganode

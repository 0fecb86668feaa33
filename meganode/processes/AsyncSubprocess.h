/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <atomic>

#include <folly/futures/Future.h>
#include <folly/futures/Promise.h>
#include <folly/io/async/AsyncTimeout.h>
#include <folly/Subprocess.h>

namespace meganode {

/**
 * A pending signal for a subprocess, settable from any thread.  Requests
 * made within one poll interval merge into one signal, which suits
 * "please stop" requests that may get repeated by a watchdog.
 */
class OneSignalFlag {
public:
  explicit OneSignalFlag(int signum) : signal_(signum) {
    noSignal_.test_and_set();  // Nothing pending yet
  }

  void sendSignal() { noSignal_.clear(); }  // Thread-safe

  // Returns true, and consumes the request, if a signal is pending.
  bool read(int& signal) {
    if (noSignal_.test_and_set()) {
      return false;
    }
    signal = signal_;
    return true;
  }

private:
  const int signal_;
  std::atomic_flag noSignal_ = ATOMIC_FLAG_INIT;
};

/**
 * The RuntimeCallback for asyncSubprocess() that delivers signals requested
 * via a OneSignalFlag.  Construct with sendSignalCallback() for template
 * deduction.
 *
 * Use a shared_ptr for the flag if the subprocess can outlive its owner.
 */
template <typename SignalFlagPtr>
class SendSignalCallback {
public:
  explicit SendSignalCallback(SignalFlagPtr flag) : flag_(std::move(flag)) {}

  // Runs in the EventBase thread, serialized with poll(), so the child
  // cannot have been reaped yet.
  void operator()(folly::Subprocess& proc) noexcept {
    int signal;
    while (flag_->read(signal)) {
      proc.sendSignal(signal);
    }
  }

private:
  SignalFlagPtr flag_;
};

template <typename SignalFlagPtr>
SendSignalCallback<SignalFlagPtr> sendSignalCallback(SignalFlagPtr flag) {
  return SendSignalCallback<SignalFlagPtr>(std::move(flag));
}

namespace detail { template <typename RuntimeCallback> class AsyncSubprocess; }

/**
 * Polls a Subprocess on an EventBase until it exits, without blocking the
 * EventBase.  MUST be called from the EventBase thread.
 *
 * The future yields the return code after the child was reaped, and never
 * yields an exception.
 *
 * `runtime_cob` runs in the EventBase thread after every poll that found
 * the child still running.  It MUST be noexcept and must not block.  This
 * is the only safe place to signal the child, since a signal sent from
 * another thread might race with the reap and hit a recycled PID.
 */
template <typename RuntimeCallback>
folly::Future<folly::ProcessReturnCode> asyncSubprocess(
    folly::EventBase* evb,
    folly::Subprocess proc,
    RuntimeCallback runtime_cob,
    uint32_t poll_ms = 10) {
  // Self-owned: deletes itself once the child is reaped, so that libevent
  // never calls into a destroyed handler.
  auto* p = new detail::AsyncSubprocess<RuntimeCallback>(
    evb, std::move(proc), std::move(runtime_cob), poll_ms
  );
  return p->start();
}

namespace detail {

template <typename RuntimeCallback>
class AsyncSubprocess : public folly::AsyncTimeout {
public:
  AsyncSubprocess(
    folly::EventBase* evb,
    folly::Subprocess proc,
    RuntimeCallback runtime_cob,
    uint32_t poll_ms
  ) : AsyncTimeout(evb),
      pollMs_(poll_ms),
      runtimeCob_(std::move(runtime_cob)),
      proc_(std::move(proc)) {}

  folly::Future<folly::ProcessReturnCode> start() {
    auto f = exited_.getFuture();
    // Nothing can fire before this returns: we are on the EventBase thread.
    scheduleTimeout(pollMs_);
    return f;
  }

  void timeoutExpired() noexcept override {
    // poll() only throws on usage errors.
    auto rc = proc_.poll();
    if (!rc.running()) {
      exited_.setValue(std::move(rc));
      delete this;
      return;
    }
    runtimeCob_(proc_);
    scheduleTimeout(pollMs_);
  }

private:
  const uint32_t pollMs_;
  RuntimeCallback runtimeCob_;
  folly::Subprocess proc_;
  folly::Promise<folly::ProcessReturnCode> exited_;
};

}  // namespace detail

}  // namespace meganode

/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <atomic>
#include <memory>

#include <folly/futures/Future.h>
#include <folly/futures/SharedPromise.h>

namespace meganode {

/**
 * A one-shot, process-wide "please shut down" signal.  Copies share the
 * same underlying state, so every holder observes the same single firing.
 *
 * Thread-safe.
 */
class NotifyOnce {
public:
  NotifyOnce() : state_(std::make_shared<State>()) {}

  // Returns true only for the call that actually fired the signal; later
  // calls are no-ops.
  bool send();

  bool isSent() const { return state_->sent_.load(); }

  // Ready once send() is called, possibly before this call.
  folly::SemiFuture<folly::Unit> recv() const {
    return state_->promise_.getSemiFuture();
  }

private:
  struct State {
    std::atomic<bool> sent_{false};
    folly::SharedPromise<folly::Unit> promise_;
  };
  std::shared_ptr<State> state_;
};

}  // namespace meganode

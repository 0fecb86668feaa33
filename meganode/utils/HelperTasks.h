/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <folly/futures/Future.h>
#include <folly/Synchronized.h>

namespace meganode {

// Where a component hands off short background jobs it does not wait for.
using HelperTaskSink =
  std::function<void(std::string name, folly::Future<folly::Unit>)>;

/**
 * Keeps track of short background jobs, such as reports to the fleet
 * manager, so that shutdown can wait for them.  Failures are logged and
 * otherwise ignored.
 *
 * Thread-safe.
 */
class HelperTasks {
public:
  void add(std::string name, folly::Future<folly::Unit> f);

  HelperTaskSink sink() {
    return [this](std::string name, folly::Future<folly::Unit> f) {
      add(std::move(name), std::move(f));
    };
  }

  // Ready once every task added so far is done, successfully or not.
  folly::Future<folly::Unit> joinAll();

  size_t numPending();
  size_t numFailed() const { return numFailed_->load(); }

private:
  folly::Synchronized<std::vector<folly::Future<folly::Unit>>> tasks_;
  // Shared with the callbacks, which may outlive this object.
  std::shared_ptr<std::atomic<size_t>> numFailed_ =
    std::make_shared<std::atomic<size_t>>(0);
};

}  // namespace meganode

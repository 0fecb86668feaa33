/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/io/async/AsyncSignalHandler.h>
#include <glog/logging.h>
#include <vector>

#include "meganode/scheduler/SchedulerLoop.h"

namespace meganode {

// Fires the process shutdown signal, which drains the workers.
class StopOnSignal : public folly::AsyncSignalHandler {
public:
  StopOnSignal(
    folly::EventBase* evb,
    std::vector<int> signals,
    SchedulerLoop* loop
  ) : folly::AsyncSignalHandler(evb), loop_(loop) {
    for (int sig : signals) {
      registerSignalHandler(sig);
    }
  }

  void signalReceived(int sig) noexcept override {
    LOG(WARNING) << "Got signal " << sig << ", draining tenants.";
    loop_->requestShutdown();
  }

private:
  SchedulerLoop* loop_;
};

}  // namespace meganode

/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "meganode/workers/NoOpWorkerLauncher.h"

#include <atomic>

#include <folly/futures/Promise.h>
#include <glog/logging.h>

namespace meganode {

namespace {

class NoOpWorker : public TenantWorker {
public:
  explicit NoOpWorker(const WorkerSpec& spec) : spec_(spec) {}

  void requestStop() noexcept override {
    if (!stopped_.exchange(true)) {
      VLOG(1) << "No-op worker for " << shortTenantName(spec_.tenant)
        << " (invocation " << spec_.invocation << ") stopping";
      exited_.setValue();
    }
  }

  folly::Future<folly::Unit> completion() override {
    return exited_.getFuture();
  }

private:
  const WorkerSpec spec_;
  std::atomic<bool> stopped_{false};
  folly::Promise<folly::Unit> exited_;
};

}  // anonymous namespace

std::unique_ptr<TenantWorker> NoOpWorkerLauncher::launch(
    const WorkerSpec& spec,
    WorkerReadyCob ready_cob) {
  auto worker = std::make_unique<NoOpWorker>(spec);
  ready_cob();
  if (spec.shutdownAfterSync) {
    worker->requestStop();
  }
  return std::move(worker);
}

}  // namespace meganode

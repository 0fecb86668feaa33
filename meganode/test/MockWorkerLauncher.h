/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <vector>

#include <folly/futures/Promise.h>
#include <folly/Synchronized.h>
#include <glog/logging.h>

#include "meganode/utils/Exception.h"
#include "meganode/workers/TenantWorker.h"

// Lets tests decide when each worker becomes ready or exits.

namespace meganode {

class MockWorkerLauncher : public WorkerLauncher {
public:
  struct Worker {
    WorkerSpec spec;
    WorkerReadyCob readyCob;
    folly::Promise<folly::Unit> exited;
    std::atomic<size_t> numStopRequests{0};
    bool finished{false};
  };

  std::unique_ptr<TenantWorker> launch(
      const WorkerSpec& spec,
      WorkerReadyCob ready_cob) override {
    auto w = std::make_shared<Worker>();
    w->spec = spec;
    w->readyCob = std::move(ready_cob);
    auto f = w->exited.getFuture();
    if (failNextLaunch_.exchange(false)) {
      throw MeganodeException("Launch failed on purpose");
    }
    workers_.wlock()->emplace(spec.invocation, w);
    return std::make_unique<Handle>(w, std::move(f));
  }

  void failNextLaunch() { failNextLaunch_ = true; }

  std::shared_ptr<Worker> get(InvocationID invocation) {
    auto workers = workers_.rlock();
    auto it = workers->find(invocation);
    CHECK(it != workers->end()) << "No invocation " << invocation;
    return it->second;
  }

  // The most recent invocation of the tenant.
  std::shared_ptr<Worker> latest(const TenantID& tenant) {
    std::shared_ptr<Worker> found;
    auto workers = workers_.rlock();
    for (const auto& p : *workers) {
      if (p.second->spec.tenant == tenant) {
        found = p.second;
      }
    }
    CHECK(found) << "No worker for " << tenant;
    return found;
  }

  void ready(const TenantID& tenant) { latest(tenant)->readyCob(); }

  void finish(const TenantID& tenant, bool fail = false) {
    finish(*latest(tenant), fail);
  }

  static void finish(Worker& w, bool fail = false) {
    CHECK(!w.finished);
    w.finished = true;
    if (fail) {
      w.exited.setException(MeganodeException("Worker crashed"));
    } else {
      w.exited.setValue();
    }
  }

  size_t numStopRequests(const TenantID& tenant) {
    return latest(tenant)->numStopRequests;
  }

  size_t numLaunched() { return workers_.rlock()->size(); }

  std::vector<std::shared_ptr<Worker>> all() {
    std::vector<std::shared_ptr<Worker>> v;
    for (const auto& p : *workers_.rlock()) {
      v.push_back(p.second);
    }
    return v;
  }

private:
  using WorkerMap = folly::Synchronized<
    std::map<InvocationID, std::shared_ptr<Worker>>
  >;

  struct Handle : public TenantWorker {
    Handle(std::shared_ptr<Worker> w, folly::Future<folly::Unit> f)
      : worker_(std::move(w)), exited_(std::move(f)) {}

    void requestStop() noexcept override { ++worker_->numStopRequests; }

    folly::Future<folly::Unit> completion() override {
      return std::move(exited_);
    }

    std::shared_ptr<Worker> worker_;
    folly::Future<folly::Unit> exited_;
  };

  WorkerMap workers_;
  std::atomic<bool> failNextLaunch_{false};
};

}  // namespace meganode

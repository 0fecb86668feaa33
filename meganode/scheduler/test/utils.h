/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/dynamic.h>
#include <folly/futures/Future.h>
#include <glog/logging.h>

#include "meganode/config/SchedulerConfig.h"
#include "meganode/scheduler/TenantScheduler.h"
#include "meganode/test/MockWorkerLauncher.h"
#include "meganode/types/MegaError.h"

namespace meganode {

const ProcessID kTestProcess = 7;

inline TenantID tenant(uint64_t n) { return TenantID::fromU64(n); }

/**
 * Memory for 5 workers of 100 bytes under the hard limit, with 2 slots of
 * buffer, so the soft limit is crossed by the 4th worker.  Short timeouts
 * keep the time arithmetic readable.
 */
inline SchedulerConfig smallConfig(folly::dynamic extra = folly::dynamic()) {
  folly::dynamic d = folly::dynamic::object
    (kProcessID, kTestProcess)
    (kTotalMemoryBytes, 600)
    (kMemoryOverheadBytes, 100)
    (kWorkerMemoryBytes, 100)
    (kWorkerBufferSlots, 2)
    (kTenantInactivitySec, 10)
    (kProcessInactivitySec, 100)
    (kLeaseLifetimeSec, 60)
    (kLeaseRenewalIntervalSec, 30);
  if (extra.isObject()) {
    d.update(extra);
  }
  return SchedulerConfig(d);
}

inline Timestamp sec(int64_t s) { return std::chrono::seconds(s); }

// A scheduler whose workers only move when the test says so.
struct SchedulerHarness {
  explicit SchedulerHarness(
    const SchedulerConfig& config = smallConfig(),
    Timestamp start = Timestamp(0)
  ) : launcher(std::make_shared<MockWorkerLauncher>()),
      sched(config, launcher, shutdown, start) {}

  folly::Future<folly::Unit> run(
      uint64_t t,
      Timestamp now,
      ProcessID process = kTestProcess,
      bool shutdown_after_sync = false) {
    RunRequest req;
    req.tenant = tenant(t);
    req.lease = 1000 + t;
    req.processID = process;
    req.shutdownAfterSync = shutdown_after_sync;
    auto f = req.ready.getFuture();
    sched.handleRunRequest(std::move(req), now);
    return f;
  }

  folly::Future<folly::Unit> runWithLease(
      uint64_t t,
      LeaseID lease,
      Timestamp now) {
    RunRequest req;
    req.tenant = tenant(t);
    req.lease = lease;
    req.processID = kTestProcess;
    auto f = req.ready.getFuture();
    sched.handleRunRequest(std::move(req), now);
    return f;
  }

  folly::Future<folly::Unit> evict(
      uint64_t t,
      Timestamp now,
      ProcessID process = kTestProcess) {
    EvictRequest req;
    req.tenant = tenant(t);
    req.processID = process;
    auto f = req.stopped.getFuture();
    sched.handleEvictRequest(std::move(req), now);
    return f;
  }

  void ready(uint64_t t, Timestamp now) {
    launcher->ready(tenant(t));
    sched.processWorkerEvents(now);
  }

  void finish(uint64_t t, Timestamp now, bool fail = false) {
    launcher->finish(tenant(t), fail);
    sched.processWorkerEvents(now);
  }

  // Admits and readies a tenant.
  void start(uint64_t t, Timestamp now) {
    auto f = run(t, now);
    ready(t, now);
    CHECK(f.isReady() && f.hasValue()) << "Tenant " << t << " not ready";
  }

  folly::Optional<TenantScheduler::State> state(uint64_t t) const {
    if (auto* e = sched.getEntry(tenant(t))) {
      return e->state;
    }
    return folly::none;
  }

  std::shared_ptr<MockWorkerLauncher> launcher;
  NotifyOnce shutdown;
  TenantScheduler sched;
};

inline MegaErrorKind errorKind(folly::Future<folly::Unit>& f) {
  CHECK(f.isReady());
  CHECK(f.hasException());
  auto* e = f.result().exception().get_exception<MegaError>();
  CHECK(e) << "Not a MegaError: " << f.result().exception().what();
  return e->kind();
}

}  // namespace meganode

/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <atomic>
#include <boost/noncopyable.hpp>
#include <memory>

#include <folly/Function.h>
#include <folly/futures/SharedPromise.h>
#include <folly/io/async/AsyncTimeout.h>
#include <folly/io/async/ScopedEventBaseThread.h>

#include "meganode/fleet/FleetManagerClient.h"
#include "meganode/scheduler/TenantScheduler.h"
#include "meganode/utils/HelperTasks.h"

namespace meganode {

/**
 * Runs a TenantScheduler on its own EventBase thread, which serializes
 * every mutation of the scheduler's state:
 *
 *  - commands, applied in the order they were submitted,
 *  - worker readiness and exits, as the supervisor queues them,
 *  - a periodic tick that runs the inactivity sweeps, the eviction
 *    watchdog, activity reports, and the summary log.
 *
 * The process shutdown signal takes precedence over all of these: once it
 * is sent, the next thing the loop does is start draining.
 *
 * The submit*() methods and requestShutdown() are thread-safe.  Do not
 * call them once the loop is being destroyed.
 */
class SchedulerLoop : boost::noncopyable {
public:
  SchedulerLoop(
    const SchedulerConfig& config,
    std::shared_ptr<WorkerLauncher> launcher,
    NotifyOnce process_shutdown,
    // Optional: without a client, activity is not reported.
    std::shared_ptr<FleetManagerClient> fleet = nullptr,
    // Optional: without a sink, report failures are just logged.
    HelperTaskSink helper_sink = nullptr
  );
  // Does not wait for workers, but asks them to stop.
  ~SchedulerLoop();

  void submitRun(RunRequest&& req);
  void submitEvict(EvictRequest&& req);
  void submitActivity(const TenantID& tenant);

  // Sends the process shutdown signal, and wakes the loop to act on it.
  void requestShutdown();

  // Ready once shutdown began, and every worker's exit has been observed.
  folly::SemiFuture<folly::Unit> drained() {
    return drained_.getSemiFuture();
  }

  // Runs `fn` on the loop thread and waits for it.  Handy for tests.
  void withScheduler(folly::Function<void(TenantScheduler&)> fn);

private:
  class Ticker : public folly::AsyncTimeout {
  public:
    Ticker(folly::EventBase* evb, SchedulerLoop* loop)
      : AsyncTimeout(evb), loop_(loop) {}
    void timeoutExpired() noexcept override;
  private:
    SchedulerLoop* loop_;
  };

  // All of these run on the loop thread.
  void onWorkerEvents();
  void tick();
  // Returns the time, for convenience.
  Timestamp checkShutdown();
  void reportActivity(Timestamp now);
  void afterEvent();

  NotifyOnce processShutdown_;
  std::shared_ptr<FleetManagerClient> fleet_;
  HelperTaskSink helperSink_;
  const std::chrono::milliseconds sweepInterval_;
  const std::chrono::milliseconds reportInterval_;

  std::unique_ptr<TenantScheduler> scheduler_;
  std::unique_ptr<Ticker> ticker_;
  Timestamp lastReport_;
  Timestamp lastSummary_;
  std::atomic<bool> wakePending_{false};
  bool drainedSent_{false};
  folly::SharedPromise<folly::Unit> drained_;

  // Declared last: stopped first, so nothing runs on the loop thread while
  // the other members are destroyed.
  folly::ScopedEventBaseThread evbThread_;
};

}  // namespace meganode

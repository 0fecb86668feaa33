/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "meganode/scheduler/SchedulerLoop.h"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "meganode/flags/Flags.h"

DEFINE_int32(
  summary_log_period_ms, 60000,
  "How often the scheduler loop logs a one-line summary of its state. "
  "Set to 0 to disable."
);

namespace meganode {

SchedulerLoop::SchedulerLoop(
    const SchedulerConfig& config,
    std::shared_ptr<WorkerLauncher> launcher,
    NotifyOnce process_shutdown,
    std::shared_ptr<FleetManagerClient> fleet,
    HelperTaskSink helper_sink)
  : processShutdown_(std::move(process_shutdown)),
    fleet_(std::move(fleet)),
    helperSink_(std::move(helper_sink)),
    sweepInterval_(config.sweepInterval),
    reportInterval_(config.activityReportInterval),
    lastReport_(systemNow()),
    lastSummary_(lastReport_),
    evbThread_("MeganodeScheduler") {
  auto* evb = evbThread_.getEventBase();
  scheduler_ = std::make_unique<TenantScheduler>(
    config,
    std::move(launcher),
    processShutdown_,
    lastReport_,
    [this, evb]() {
      // Coalesce bursts of worker events into one drain.
      if (!wakePending_.exchange(true)) {
        evb->runInEventBaseThread([this]() { onWorkerEvents(); });
      }
    }
  );
  evb->runInEventBaseThreadAndWait([this, evb]() {
    ticker_ = std::make_unique<Ticker>(evb, this);
    ticker_->scheduleTimeout(sweepInterval_);
  });
}

SchedulerLoop::~SchedulerLoop() {
  // Destroying the scheduler stops its wakeups, so after this, nothing
  // new gets queued on the EventBase.
  evbThread_.getEventBase()->runInEventBaseThreadAndWait([this]() {
    ticker_.reset();
    if (scheduler_->numEntries()) {
      LOG(WARNING) << "Destroying scheduler loop with "
        << scheduler_->numEntries() << " tenants not yet stopped";
    }
    scheduler_.reset();
  });
}

void SchedulerLoop::Ticker::timeoutExpired() noexcept {
  loop_->tick();
  scheduleTimeout(loop_->sweepInterval_);
}

void SchedulerLoop::submitRun(RunRequest&& req) {
  evbThread_.getEventBase()->runInEventBaseThread(
    [this, req = std::move(req)]() mutable {
      auto now = checkShutdown();
      scheduler_->handleRunRequest(std::move(req), now);
      afterEvent();
    }
  );
}

void SchedulerLoop::submitEvict(EvictRequest&& req) {
  evbThread_.getEventBase()->runInEventBaseThread(
    [this, req = std::move(req)]() mutable {
      auto now = checkShutdown();
      scheduler_->handleEvictRequest(std::move(req), now);
      afterEvent();
    }
  );
}

void SchedulerLoop::submitActivity(const TenantID& tenant) {
  evbThread_.getEventBase()->runInEventBaseThread([this, tenant]() {
    auto now = checkShutdown();
    scheduler_->handleActivity(tenant, now);
    afterEvent();
  });
}

void SchedulerLoop::requestShutdown() {
  if (processShutdown_.send()) {
    LOG(INFO) << "Process shutdown requested";
  }
  evbThread_.getEventBase()->runInEventBaseThread([this]() {
    checkShutdown();
    afterEvent();
  });
}

void SchedulerLoop::withScheduler(
    folly::Function<void(TenantScheduler&)> fn) {
  evbThread_.getEventBase()->runInEventBaseThreadAndWait(
    [this, &fn]() { fn(*scheduler_); }
  );
}

Timestamp SchedulerLoop::checkShutdown() {
  auto now = systemNow();
  if (processShutdown_.isSent() && !scheduler_->isShuttingDown()) {
    scheduler_->beginShutdown(now);
  }
  return now;
}

void SchedulerLoop::onWorkerEvents() {
  if (!scheduler_) {
    return;  // A late wakeup during destruction
  }
  wakePending_ = false;  // Before draining, so no event is missed.
  auto now = checkShutdown();
  scheduler_->processWorkerEvents(now);
  afterEvent();
}

void SchedulerLoop::tick() {
  auto now = checkShutdown();
  scheduler_->evictAnyInactiveWorkers(now);
  scheduler_->checkStuckEvictions(now);
  scheduler_->shutdownProcessIfInactive(now);
  if (now - lastReport_ >= reportInterval_) {
    lastReport_ = now;
    reportActivity(now);
  }
  if (FLAGS_summary_log_period_ms > 0 && now - lastSummary_
      >= std::chrono::milliseconds(FLAGS_summary_log_period_ms)) {
    lastSummary_ = now;
    LOG(INFO) << "Scheduler " << scheduler_->summary();
  }
  afterEvent();
}

void SchedulerLoop::reportActivity(Timestamp /*now*/) {
  auto batch = scheduler_->takeActivityBatch();
  if (!fleet_ || batch.empty()) {
    return;
  }
  VLOG(1) << "Reporting activity of " << batch.size() << " tenants";
  // A client that throws is treated like a failed report.
  auto f = folly::makeFutureWith([&]() {
    return fleet_->reportActivity(scheduler_->processID(), std::move(batch));
  });
  if (helperSink_) {
    helperSink_("report_activity", std::move(f));
  } else {
    std::move(f).thenTry([](folly::Try<folly::Unit>&& t) noexcept {
      if (t.hasException()) {
        LOG(WARNING) << "Failed to report activity: "
          << t.exception().what();
      }
    });
  }
}

void SchedulerLoop::afterEvent() {
  if (!drainedSent_ && scheduler_->isDrained()) {
    drainedSent_ = true;
    LOG(INFO) << "All workers stopped, scheduler is drained";
    drained_.setValue();
  }
}

}  // namespace meganode

/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/noncopyable.hpp>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <folly/Optional.h>
#include <folly/futures/Promise.h>
#include <folly/Try.h>

#include "meganode/config/SchedulerConfig.h"
#include "meganode/scheduler/MemoryBudget.h"
#include "meganode/scheduler/RecencyTracker.h"
#include "meganode/scheduler/SchedulerStats.h"
#include "meganode/types/Requests.h"
#include "meganode/utils/NotifyOnce.h"
#include "meganode/workers/WorkerSupervisor.h"

namespace meganode {

/**
 * Decides which tenants run in this mega-process.  It admits tenants
 * within the memory budget, evicts idle ones, and tracks each worker
 * from admission until its exit is observed.
 *
 * Every tenant with an entry is in exactly one state:
 *
 *   (absent) -> STARTING -> RUNNING -> EVICTING -> (absent)
 *                  \______________________/^
 *
 * An entry holds its memory slot until the worker's exit is observed, so
 * an evicting tenant still counts against the budget.  Only STARTING and
 * RUNNING tenants are in the recency tracker, and only RUNNING ones are
 * ever picked as eviction victims.
 *
 * All `now` arguments come from the caller, which keeps the scheduler
 * deterministic under test.  Not thread-safe: the handlers are meant to be
 * serialized by a single loop (see SchedulerLoop).  Worker events are
 * queued by the supervisor from any thread, and applied only when the
 * loop calls processWorkerEvents().
 */
class TenantScheduler : boost::noncopyable {
public:
  enum class State { STARTING, RUNNING, EVICTING };

  struct WorkerEntry {
    TenantID tenant;
    State state;
    LeaseID lease;
    InvocationID invocation;
    bool shutdownAfterSync;
    Timestamp lastActive;
    // When the last stop request was sent; only meaningful while EVICTING.
    Timestamp stopRequestedAt{0};
    EvictCause evictCause{EvictCause::REQUEST};
    // Fulfilled on readiness.  Only STARTING entries have any.
    std::vector<folly::Promise<folly::Unit>> readyWaiters;
    // Fulfilled once the exit is observed.  Only EVICTING entries have any.
    std::vector<folly::Promise<folly::Unit>> stoppedWaiters;
  };

  TenantScheduler(
    const SchedulerConfig& config,
    std::shared_ptr<WorkerLauncher> launcher,
    NotifyOnce process_shutdown,
    Timestamp now,
    // Called from worker threads; should arrange a processWorkerEvents().
    WorkerSupervisor::WakeCob wake_cob = nullptr
  );

  /**
   * Admits the tenant, or renews its lease.  `req.ready` is fulfilled once
   * the worker is serving, or fails with a MegaError if the tenant cannot
   * run here.
   */
  void handleRunRequest(RunRequest&& req, Timestamp now);

  /**
   * Stops the tenant.  `req.stopped` is fulfilled once its worker exit is
   * observed, or at once if it is not running here.
   */
  void handleEvictRequest(EvictRequest&& req, Timestamp now);

  // The tenant did something; defers its inactivity eviction.
  void handleActivity(const TenantID& tenant, Timestamp now);

  // Applies queued worker events.  Returns how many were processed.
  size_t processWorkerEvents(Timestamp now);

  void handleWorkerReady(const TenantID& tenant, InvocationID invocation);
  // Frees the tenant's slot, and resolves all of its notifiers.
  void handleWorkerFinished(
    const TenantID& tenant,
    InvocationID invocation,
    folly::exception_wrapper error,
    Timestamp now
  );

  // Evicts RUNNING tenants idle for longer than the tenant inactivity
  // timeout.  Returns how many were evicted.
  size_t evictAnyInactiveWorkers(Timestamp now);

  /**
   * Fires the process shutdown signal if no tenant has an entry, and
   * nothing happened for longer than the process inactivity timeout.
   * Returns true iff this call fired the signal.
   */
  bool shutdownProcessIfInactive(Timestamp now);

  // Re-sends stop requests to workers that are slow to exit.  Returns how
  // many were found stuck.
  size_t checkStuckEvictions(Timestamp now);

  /**
   * Stops taking new tenants, and asks every worker to stop.  Idempotent.
   * Once isDrained(), all notifiers have been resolved.
   */
  void beginShutdown(Timestamp now);
  bool isShuttingDown() const { return shuttingDown_; }
  bool isDrained() const { return shuttingDown_ && entries_.empty(); }

  // Tenants seen active since the last call, in first-seen order.
  std::vector<TenantID> takeActivityBatch();

  /**
   * Cross-checks the entry table, the recency tracker, the memory budget,
   * and the supervisor.  A violation is fatal, unless
   * --CAUTION_tolerate_invariant_violations, in which case it is logged and
   * counted.  Returns the number of violations found.
   */
  size_t assertInvariants();

  // One line for periodic logging.
  std::string summary() const;

  const WorkerEntry* getEntry(const TenantID& tenant) const;
  size_t numEntries() const { return entries_.size(); }
  size_t numInState(State state) const;
  const MemoryBudget& budget() const { return budget_; }
  const RecencyTracker& recency() const { return recency_; }
  const SchedulerStats& stats() const { return stats_; }
  ProcessID processID() const { return config_.processID; }

private:
  void admitNew(RunRequest&& req, Timestamp now);
  void renew(WorkerEntry& entry, RunRequest&& req, Timestamp now);
  // Picks the least recently active RUNNING tenant, if any.
  folly::Optional<TenantID> findVictim() const;
  // Moves a STARTING or RUNNING entry to EVICTING, and asks it to stop.
  void beginEviction(WorkerEntry& entry, EvictCause cause, Timestamp now);
  void noteActivity(const TenantID& tenant);
  void reportViolations(const std::vector<std::string>& violations);

  const SchedulerConfig config_;
  MemoryBudget budget_;
  RecencyTracker recency_;
  WorkerSupervisor supervisor_;
  NotifyOnce processShutdown_;

  std::unordered_map<TenantID, WorkerEntry> entries_;
  size_t numEvicting_{0};
  InvocationID nextInvocation_{1};
  Timestamp lastProcessActivity_;
  bool shuttingDown_{false};

  std::vector<TenantID> activityBatch_;
  std::unordered_set<TenantID> activityBatchSet_;

  SchedulerStats stats_;
};

const char* tenantStateName(TenantScheduler::State state);

}  // namespace meganode

/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "meganode/scheduler/TenantScheduler.h"

#include <folly/Conv.h>
#include <folly/json.h>
#include <gflags/gflags.h>
#include <glog/logging.h>

#include "meganode/flags/Flags.h"
#include "meganode/types/MegaError.h"

DEFINE_bool(
  CAUTION_tolerate_invariant_violations, false,
  "By default, a scheduler whose bookkeeping is inconsistent crashes, since "
  "its further admission decisions could overcommit memory. With this set, "
  "violations are only logged and counted. Use only to keep a production "
  "process alive while debugging."
);

namespace meganode {

namespace {
std::string workerName(const TenantScheduler::WorkerEntry& e) {
  return folly::to<std::string>(shortTenantName(e.tenant), "/", e.invocation);
}
}  // anonymous namespace

const char* tenantStateName(TenantScheduler::State state) {
  switch (state) {
    case TenantScheduler::State::STARTING: return "starting";
    case TenantScheduler::State::RUNNING: return "running";
    case TenantScheduler::State::EVICTING: return "evicting";
  }
  LOG(FATAL) << "Bad tenant state " << static_cast<int>(state);
  return nullptr;  // Not reached
}

TenantScheduler::TenantScheduler(
    const SchedulerConfig& config,
    std::shared_ptr<WorkerLauncher> launcher,
    NotifyOnce process_shutdown,
    Timestamp now,
    WorkerSupervisor::WakeCob wake_cob)
  : config_(config),
    budget_(config_),
    supervisor_(std::move(launcher), std::move(wake_cob)),
    processShutdown_(std::move(process_shutdown)),
    lastProcessActivity_(now) {
  LOG(INFO) << "Scheduler for process " << config_.processID << " can run "
    << budget_.maxWorkers() << " workers of " << (budget_.perWorker() >> 20)
    << " MiB, hard limit " << (budget_.hardLimit() >> 20) << " MiB, soft "
    << "limit " << (budget_.softLimit() >> 20) << " MiB";
}

void TenantScheduler::handleRunRequest(RunRequest&& req, Timestamp now) {
  if (req.processID != config_.processID) {
    ++stats_.misrouted;
    VLOG(1) << "Ignoring run request for " << req.tenant << " addressed to "
      << "process " << req.processID;
    req.ready.setException(
      MegaError::wrongProcessID(req.processID, config_.processID)
    );
    return;
  }
  lastProcessActivity_ = now;
  if (shuttingDown_) {
    ++stats_.denials;
    LOG(WARNING) << "Shutting down, denying " << shortTenantName(req.tenant);
    req.ready.setException(MegaError(
      MegaErrorKind::SHUTTING_DOWN,
      folly::to<std::string>("Process ", config_.processID, " is draining")
    ));
    return;
  }
  auto it = entries_.find(req.tenant);
  if (it == entries_.end()) {
    admitNew(std::move(req), now);
  } else {
    renew(it->second, std::move(req), now);
  }
  assertInvariants();
}

void TenantScheduler::renew(
    WorkerEntry& entry,
    RunRequest&& req,
    Timestamp now) {
  if (entry.state == State::EVICTING) {
    ++stats_.denials;
    LOG(WARNING) << "Denying renewal of " << workerName(entry)
      << ", which is being evicted";
    req.ready.setException(MegaError(
      MegaErrorKind::TENANT_EVICTING,
      folly::to<std::string>(
        "Tenant ", shortTenantName(entry.tenant), " is stopping, retry later"
      )
    ));
    return;
  }
  ++stats_.renewals;
  entry.lease = req.lease;
  entry.lastActive = recency_.touch(entry.tenant, now);
  noteActivity(entry.tenant);
  if (entry.state == State::RUNNING) {
    req.ready.setValue();
  } else {
    entry.readyWaiters.emplace_back(std::move(req.ready));
  }
}

void TenantScheduler::admitNew(RunRequest&& req, Timestamp now) {
  // An evicted worker holds its slot until its exit is observed, so this
  // stops every running tenant before giving up, and the fleet manager
  // retries once the slots free up.
  while (!budget_.wouldFit(1)) {
    auto victim = findVictim();
    if (!victim) {
      break;
    }
    beginEviction(entries_.at(*victim), EvictCause::CAPACITY, now);
  }
  if (!budget_.wouldFit(1)) {
    ++stats_.denials;
    LOG(WARNING) << "At capacity with " << budget_.numWorkers()
      << " workers (" << numEvicting_ << " stopping), denying "
      << shortTenantName(req.tenant);
    req.ready.setException(
      MegaError::atCapacity(req.tenant, budget_.numWorkers())
    );
    return;
  }
  if (budget_.overSoft(1)) {
    if (auto victim = findVictim()) {
      beginEviction(entries_.at(*victim), EvictCause::PROACTIVE, now);
    }
  }

  budget_.admit();
  WorkerEntry entry;
  entry.tenant = req.tenant;
  entry.state = State::STARTING;
  entry.lease = req.lease;
  entry.invocation = nextInvocation_++;
  entry.shutdownAfterSync = req.shutdownAfterSync;
  entry.lastActive = recency_.touch(req.tenant, now);
  entry.readyWaiters.emplace_back(std::move(req.ready));
  auto& e = entries_.emplace(req.tenant, std::move(entry)).first->second;
  noteActivity(e.tenant);
  ++stats_.admissions;
  LOG(INFO) << "Admitting " << workerName(e) << " with lease " << e.lease
    << ", " << budget_.numWorkers() << " of " << budget_.maxWorkers()
    << " slots used";
  supervisor_.spawn(WorkerSpec{
    e.tenant, e.lease, e.invocation, e.shutdownAfterSync
  });
}

folly::Optional<TenantID> TenantScheduler::findVictim() const {
  for (const auto& item : recency_) {
    auto it = entries_.find(item.tenant);
    if (it != entries_.end() && it->second.state == State::RUNNING) {
      return item.tenant;
    }
  }
  return folly::none;
}

void TenantScheduler::beginEviction(
    WorkerEntry& entry,
    EvictCause cause,
    Timestamp now) {
  CHECK(entry.state != State::EVICTING) << workerName(entry);
  for (auto& p : entry.readyWaiters) {
    p.setException(MegaError(
      MegaErrorKind::TENANT_EVICTING,
      folly::to<std::string>(
        "Tenant ", shortTenantName(entry.tenant), " was evicted (",
        evictCauseName(cause), ") before it became ready"
      )
    ));
  }
  entry.readyWaiters.clear();
  entry.state = State::EVICTING;
  entry.evictCause = cause;
  entry.stopRequestedAt = now;
  recency_.remove(entry.tenant);
  ++numEvicting_;
  stats_.countEviction(cause);
  if (cause == EvictCause::EXITED) {
    return;  // Nothing to stop
  }
  LOG(INFO) << "Evicting " << workerName(entry) << " ("
    << evictCauseName(cause) << ")";
  if (!supervisor_.stop(entry.tenant, entry.invocation)) {
    LOG(ERROR) << "Supervisor has no worker " << workerName(entry);
  }
}

void TenantScheduler::handleEvictRequest(EvictRequest&& req, Timestamp now) {
  if (req.processID != config_.processID) {
    ++stats_.misrouted;
    VLOG(1) << "Ignoring evict request for " << req.tenant << " addressed "
      << "to process " << req.processID;
    req.stopped.setValue();
    return;
  }
  lastProcessActivity_ = now;
  auto it = entries_.find(req.tenant);
  if (it == entries_.end()) {
    VLOG(1) << "Evict request for " << shortTenantName(req.tenant)
      << ", which is not running";
    req.stopped.setValue();
    return;
  }
  auto& entry = it->second;
  if (entry.state != State::EVICTING) {
    beginEviction(entry, EvictCause::REQUEST, now);
  }
  entry.stoppedWaiters.emplace_back(std::move(req.stopped));
  assertInvariants();
}

void TenantScheduler::handleActivity(const TenantID& tenant, Timestamp now) {
  lastProcessActivity_ = now;
  auto it = entries_.find(tenant);
  if (it == entries_.end() || it->second.state == State::EVICTING) {
    VLOG(1) << "Ignoring activity of " << shortTenantName(tenant)
      << (it == entries_.end() ? ", which is not running" : ", evicting");
    return;
  }
  it->second.lastActive = recency_.touch(tenant, now);
  noteActivity(tenant);
}

void TenantScheduler::noteActivity(const TenantID& tenant) {
  if (activityBatchSet_.insert(tenant).second) {
    activityBatch_.push_back(tenant);
  }
}

std::vector<TenantID> TenantScheduler::takeActivityBatch() {
  std::vector<TenantID> batch;
  batch.swap(activityBatch_);
  activityBatchSet_.clear();
  return batch;
}

size_t TenantScheduler::processWorkerEvents(Timestamp now) {
  auto events = supervisor_.drainEvents();
  for (auto& ev : events) {
    if (ev.type == WorkerEvent::Type::READY) {
      handleWorkerReady(ev.tenant, ev.invocation);
    } else {
      handleWorkerFinished(ev.tenant, ev.invocation, std::move(ev.error), now);
    }
  }
  return events.size();
}

void TenantScheduler::handleWorkerReady(
    const TenantID& tenant,
    InvocationID invocation) {
  auto it = entries_.find(tenant);
  if (it == entries_.end() || it->second.invocation != invocation) {
    VLOG(1) << "Stale ready event for " << shortTenantName(tenant) << "/"
      << invocation;
    return;
  }
  auto& entry = it->second;
  if (entry.state == State::EVICTING) {
    VLOG(1) << "Worker " << workerName(entry) << " became ready while "
      << "being evicted";
    return;
  }
  if (entry.state == State::RUNNING) {
    LOG(WARNING) << "Worker " << workerName(entry) << " was already ready";
    return;
  }
  entry.state = State::RUNNING;
  LOG(INFO) << "Worker " << workerName(entry) << " is ready, notifying "
    << entry.readyWaiters.size() << " waiters";
  for (auto& p : entry.readyWaiters) {
    p.setValue();
  }
  entry.readyWaiters.clear();
  assertInvariants();
}

void TenantScheduler::handleWorkerFinished(
    const TenantID& tenant,
    InvocationID invocation,
    folly::exception_wrapper error,
    Timestamp now) {
  auto it = entries_.find(tenant);
  if (it == entries_.end() || it->second.invocation != invocation) {
    VLOG(1) << "Stale exit event for " << shortTenantName(tenant) << "/"
      << invocation;
    return;
  }
  auto& entry = it->second;
  if (error) {
    ++stats_.workerFailures;
  }

  if (entry.state != State::EVICTING) {
    // Nobody asked the worker to stop, so nobody is waiting for it.
    if (error) {
      LOG(ERROR) << "Worker " << workerName(entry) << " ("
        << tenantStateName(entry.state) << ") failed: " << error.what();
    } else {
      LOG(INFO) << "Worker " << workerName(entry) << " ("
        << tenantStateName(entry.state) << ") exited on its own";
    }
    if (entry.state == State::STARTING) {
      // A worker told to stop after syncing may finish without ever
      // reporting readiness, which means it did its job.
      const bool synced = !error && entry.shutdownAfterSync;
      for (auto& p : entry.readyWaiters) {
        if (synced) {
          p.setValue();
        } else {
          p.setException(MegaError(
            MegaErrorKind::WORKER_FAILED,
            folly::to<std::string>(
              "Worker ", workerName(entry), " exited before it was ready",
              error ? folly::to<std::string>(": ", error.what()) : ""
            )
          ));
        }
      }
      entry.readyWaiters.clear();
    }
    beginEviction(entry, EvictCause::EXITED, now);
  } else if (error) {
    LOG(WARNING) << "Worker " << workerName(entry) << " failed while "
      << "stopping (" << evictCauseName(entry.evictCause) << "): "
      << error.what();
  } else {
    LOG(INFO) << "Worker " << workerName(entry) << " stopped ("
      << evictCauseName(entry.evictCause) << "), notifying "
      << entry.stoppedWaiters.size() << " waiters";
  }

  for (auto& p : entry.stoppedWaiters) {
    p.setValue();
  }
  CHECK(supervisor_.forget(tenant, invocation)) << workerName(entry);
  --numEvicting_;
  budget_.release();
  entries_.erase(it);
  assertInvariants();
}

size_t TenantScheduler::evictAnyInactiveWorkers(Timestamp now) {
  std::vector<TenantID> idle;
  // Oldest first, so stop at the first tenant that is recent enough.
  for (const auto& item : recency_) {
    if (now - item.lastActive <= config_.tenantInactivity) {
      break;
    }
    auto it = entries_.find(item.tenant);
    if (it != entries_.end() && it->second.state == State::RUNNING) {
      idle.push_back(item.tenant);
    }
  }
  for (const auto& tenant : idle) {
    beginEviction(entries_.at(tenant), EvictCause::INACTIVITY, now);
  }
  assertInvariants();
  return idle.size();
}

bool TenantScheduler::shutdownProcessIfInactive(Timestamp now) {
  if (!entries_.empty()
      || now - lastProcessActivity_ <= config_.processInactivity) {
    return false;
  }
  if (!processShutdown_.send()) {
    return false;
  }
  LOG(INFO) << "Process " << config_.processID << " has been idle for "
    << (now - lastProcessActivity_).count() << " ms, shutting down";
  beginShutdown(now);
  return true;
}

size_t TenantScheduler::checkStuckEvictions(Timestamp now) {
  if (config_.evictionWatchdog.count() == 0) {
    return 0;
  }
  size_t num_stuck = 0;
  for (auto& p : entries_) {
    auto& entry = p.second;
    if (entry.state != State::EVICTING
        || now - entry.stopRequestedAt <= config_.evictionWatchdog) {
      continue;
    }
    ++num_stuck;
    ++stats_.stuckEvictions;
    LOG(ERROR) << "Worker " << workerName(entry) << " has not exited "
      << (now - entry.stopRequestedAt).count() << " ms after being asked "
      << "to stop (" << evictCauseName(entry.evictCause) << "), asking again";
    entry.stopRequestedAt = now;
    supervisor_.stop(entry.tenant, entry.invocation);
  }
  return num_stuck;
}

void TenantScheduler::beginShutdown(Timestamp now) {
  if (shuttingDown_) {
    return;
  }
  shuttingDown_ = true;
  LOG(INFO) << "Draining process " << config_.processID << ", stopping "
    << (entries_.size() - numEvicting_) << " workers";
  for (auto& p : entries_) {
    if (p.second.state != State::EVICTING) {
      beginEviction(p.second, EvictCause::SHUTDOWN, now);
    }
  }
  assertInvariants();
}

size_t TenantScheduler::numInState(State state) const {
  size_t n = 0;
  for (const auto& p : entries_) {
    if (p.second.state == state) {
      ++n;
    }
  }
  return n;
}

const TenantScheduler::WorkerEntry* TenantScheduler::getEntry(
    const TenantID& tenant) const {
  auto it = entries_.find(tenant);
  return it == entries_.end() ? nullptr : &it->second;
}

size_t TenantScheduler::assertInvariants() {
  std::vector<std::string> violations;
  auto violation = [&](auto&&... args) {
    violations.emplace_back(folly::to<std::string>(args...));
  };

  size_t num_starting = 0, num_evicting = 0;
  for (const auto& p : entries_) {
    const auto& entry = p.second;
    if (p.first != entry.tenant) {
      violation("Entry for ", p.first, " names tenant ", entry.tenant);
    }
    if (!supervisor_.contains(entry.tenant, entry.invocation)) {
      violation("Supervisor lacks worker ", workerName(entry));
    }
    switch (entry.state) {
      case State::STARTING:
        ++num_starting;
        break;
      case State::RUNNING:
        if (!entry.readyWaiters.empty()) {
          violation("Running ", workerName(entry), " has ready waiters");
        }
        break;
      case State::EVICTING:
        ++num_evicting;
        if (!entry.readyWaiters.empty()) {
          violation("Evicting ", workerName(entry), " has ready waiters");
        }
        break;
      default:
        violation("Bad state ", static_cast<int>(entry.state), " of ",
                  workerName(entry));
    }
    if (entry.state != State::EVICTING) {
      if (!entry.stoppedWaiters.empty()) {
        violation(tenantStateName(entry.state), " ", workerName(entry),
                  " has stopped waiters");
      }
      auto tracked = recency_.lastActive(entry.tenant);
      if (!tracked) {
        violation(tenantStateName(entry.state), " ", workerName(entry),
                  " is not in the recency tracker");
      } else if (*tracked != entry.lastActive) {
        violation(workerName(entry), " was last active at ",
                  entry.lastActive.count(), " ms, but the recency tracker "
                  "says ", tracked->count(), " ms");
      }
      if (shuttingDown_) {
        violation(workerName(entry), " is ", tenantStateName(entry.state),
                  " while shutting down");
      }
    } else if (recency_.contains(entry.tenant)) {
      violation("Evicting ", workerName(entry), " is in the recency tracker");
    }
  }
  if (recency_.size() != entries_.size() - num_evicting) {
    violation("Recency tracker has ", recency_.size(), " tenants, but ",
              entries_.size() - num_evicting, " are starting or running");
  }
  if (num_evicting != numEvicting_) {
    violation("Counted ", num_evicting, " evicting, expected ", numEvicting_);
  }
  if (budget_.numWorkers() != entries_.size()) {
    violation("Budget has ", budget_.numWorkers(), " workers, but there are ",
              entries_.size(), " entries");
  }
  if (!budget_.wouldFit(0)) {
    violation("Using ", budget_.currentMemory(), " bytes, over the hard "
              "limit of ", budget_.hardLimit());
  }
  if (supervisor_.size() != entries_.size()) {
    violation("Supervisor has ", supervisor_.size(), " workers, but there "
              "are ", entries_.size(), " entries");
  }

  reportViolations(violations);
  return violations.size();
}

void TenantScheduler::reportViolations(
    const std::vector<std::string>& violations) {
  if (violations.empty()) {
    return;
  }
  for (const auto& v : violations) {
    LOG(ERROR) << "Scheduler invariant violated: " << v;
  }
  stats_.invariantViolations += violations.size();
  if (!FLAGS_CAUTION_tolerate_invariant_violations) {
    LOG(FATAL) << "Scheduler state is inconsistent, aborting. State: "
      << summary();
  }
}

std::string TenantScheduler::summary() const {
  return folly::to<std::string>(
    "process ", config_.processID, ": ", entries_.size(), " tenants (",
    numInState(State::STARTING), " starting, ",
    numInState(State::RUNNING), " running, ", numEvicting_, " evicting), ",
    budget_.currentMemory() >> 20, " MiB used, soft limit ",
    budget_.softLimit() >> 20, " MiB, hard limit ",
    budget_.hardLimit() >> 20, " MiB, stats ",
    folly::toJson(stats_.toDynamic())
  );
}

}  // namespace meganode

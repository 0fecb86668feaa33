/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/noncopyable.hpp>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

#include <folly/ExceptionWrapper.h>
#include <folly/Synchronized.h>

#include "meganode/workers/TenantWorker.h"

namespace meganode {

/**
 * Something happened to a worker.  Events for one worker arrive in the
 * order the worker produced them, but READY may race with FINISHED if the
 * worker signals both from different threads.  The invocation ID lets the
 * scheduler discard events that no longer match its table.
 */
struct WorkerEvent {
  enum class Type { READY, FINISHED };

  Type type;
  TenantID tenant;
  InvocationID invocation;
  // Only for FINISHED: set iff the worker failed.
  folly::exception_wrapper error;
};

/**
 * Owns the running tenant workers, and turns their readiness and exit
 * signals into a single queue of WorkerEvents.  Workers report from
 * arbitrary threads; the scheduler drains the queue from its own thread.
 *
 * Every spawned worker produces exactly one FINISHED event, even if it
 * could not be launched.  The worker's slot is held until the scheduler
 * calls forget(), so that size() keeps counting workers whose exit has
 * not yet been observed.
 *
 * Not thread-safe, except for the event queue.
 */
class WorkerSupervisor : boost::noncopyable {
public:
  // Called from a worker's thread whenever an event is queued.  Must be
  // thread-safe, and should only schedule a drainEvents() call.
  using WakeCob = std::function<void()>;

  WorkerSupervisor(std::shared_ptr<WorkerLauncher> launcher, WakeCob wake_cob);
  // Asks any remaining workers to stop; later events are dropped.
  ~WorkerSupervisor();

  /**
   * Starts a worker.  CHECK-fails if the tenant already has one, since the
   * scheduler must observe the previous worker's exit first.
   */
  void spawn(const WorkerSpec& spec);

  /**
   * Sends a stop request to the tenant's worker, if it is still this
   * invocation.  Returns false if there is no such worker.
   */
  bool stop(const TenantID& tenant, InvocationID invocation);

  /**
   * Called after the scheduler handled a FINISHED event.  Returns false if
   * the invocation does not match.
   */
  bool forget(const TenantID& tenant, InvocationID invocation);

  // Events in the order they were queued.
  std::vector<WorkerEvent> drainEvents();

  bool contains(const TenantID& tenant, InvocationID invocation) const;
  size_t size() const { return workers_.size(); }

private:
  struct Slot {
    InvocationID invocation;
    // Null if launching failed.
    std::unique_ptr<TenantWorker> worker;
  };

  // Shared with worker callbacks, which can outlive the supervisor.
  struct EventQueue {
    void push(WorkerEvent&& event);

    folly::Synchronized<std::vector<WorkerEvent>> events_;
    folly::Synchronized<WakeCob> wakeCob_;
  };

  std::shared_ptr<WorkerLauncher> launcher_;
  std::shared_ptr<EventQueue> queue_;
  std::unordered_map<TenantID, Slot> workers_;
};

}  // namespace meganode

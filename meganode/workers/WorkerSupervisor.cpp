/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "meganode/workers/WorkerSupervisor.h"

#include <glog/logging.h>

namespace meganode {

void WorkerSupervisor::EventQueue::push(WorkerEvent&& event) {
  events_.wlock()->emplace_back(std::move(event));
  // Hold the lock so the supervisor's destructor cannot race the wakeup.
  auto wake_cob = wakeCob_.rlock();
  if (*wake_cob) {
    (*wake_cob)();
  }
}

WorkerSupervisor::WorkerSupervisor(
    std::shared_ptr<WorkerLauncher> launcher,
    WakeCob wake_cob)
  : launcher_(std::move(launcher)),
    queue_(std::make_shared<EventQueue>()) {
  *queue_->wakeCob_.wlock() = std::move(wake_cob);
}

WorkerSupervisor::~WorkerSupervisor() {
  *queue_->wakeCob_.wlock() = nullptr;
  for (auto& p : workers_) {
    if (p.second.worker) {
      LOG(WARNING) << "Abandoning worker for " << shortTenantName(p.first)
        << " (invocation " << p.second.invocation << "), asking it to stop";
      p.second.worker->requestStop();
    }
  }
}

void WorkerSupervisor::spawn(const WorkerSpec& spec) {
  CHECK(workers_.count(spec.tenant) == 0)
    << "Worker for " << spec.tenant << " is still running";
  auto& slot = workers_[spec.tenant];
  slot.invocation = spec.invocation;

  std::weak_ptr<EventQueue> weak_queue = queue_;
  const auto tenant = spec.tenant;
  const auto invocation = spec.invocation;
  try {
    slot.worker = launcher_->launch(spec, [weak_queue, tenant, invocation]() {
      if (auto queue = weak_queue.lock()) {
        queue->push(WorkerEvent{
          WorkerEvent::Type::READY, tenant, invocation, {}
        });
      }
    });
    CHECK(slot.worker) << "Launcher returned no worker for " << tenant;
  } catch (const std::exception& e) {
    LOG(WARNING) << "Failed to launch worker for " << shortTenantName(tenant)
      << ": " << e.what();
    queue_->push(WorkerEvent{
      WorkerEvent::Type::FINISHED,
      tenant,
      invocation,
      folly::exception_wrapper{std::current_exception()}
    });
    return;
  }

  slot.worker->completion().thenTry(
    [weak_queue, tenant, invocation](folly::Try<folly::Unit>&& t) noexcept {
      auto queue = weak_queue.lock();
      if (!queue) {
        return;
      }
      queue->push(WorkerEvent{
        WorkerEvent::Type::FINISHED,
        tenant,
        invocation,
        t.hasException() ? std::move(t.exception()) : folly::exception_wrapper()
      });
    }
  );
}

bool WorkerSupervisor::stop(const TenantID& tenant, InvocationID invocation) {
  auto it = workers_.find(tenant);
  if (it == workers_.end() || it->second.invocation != invocation) {
    return false;
  }
  if (it->second.worker) {
    it->second.worker->requestStop();
  }
  return true;
}

bool WorkerSupervisor::forget(const TenantID& tenant, InvocationID invocation) {
  auto it = workers_.find(tenant);
  if (it == workers_.end() || it->second.invocation != invocation) {
    return false;
  }
  workers_.erase(it);
  return true;
}

std::vector<WorkerEvent> WorkerSupervisor::drainEvents() {
  std::vector<WorkerEvent> events;
  queue_->events_.wlock()->swap(events);
  return events;
}

bool WorkerSupervisor::contains(
    const TenantID& tenant,
    InvocationID invocation) const {
  auto it = workers_.find(tenant);
  return it != workers_.end() && it->second.invocation == invocation;
}

}  // namespace meganode

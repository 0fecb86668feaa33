/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace meganode {

class SchedulerConfig;

/**
 * Pure accounting of the process heap available to tenant workers.  Every
 * worker is charged the same fixed estimate from the moment it is admitted
 * until its exit is observed.
 *
 *   hard limit = total memory - shared overhead
 *   soft limit = hard limit - buffer slots * per-worker estimate
 *
 * The scheduler never admits past the hard limit, and proactively evicts
 * idle tenants once admitting would cross the soft limit.
 */
class MemoryBudget {
public:
  MemoryBudget(
    uint64_t total_bytes,
    uint64_t overhead_bytes,
    uint64_t per_worker_bytes,
    uint64_t buffer_slots
  );
  explicit MemoryBudget(const SchedulerConfig& config);

  uint64_t hardLimit() const { return hardLimit_; }
  uint64_t softLimit() const { return softLimit_; }
  uint64_t targetBuffer() const { return targetBuffer_; }
  uint64_t perWorker() const { return perWorker_; }

  size_t numWorkers() const { return numWorkers_; }
  uint64_t currentMemory() const { return numWorkers_ * perWorker_; }
  // The most workers that fit under the hard limit.
  size_t maxWorkers() const { return hardLimit_ / perWorker_; }

  bool wouldFit(size_t num_more) const {
    return (numWorkers_ + num_more) * perWorker_ <= hardLimit_;
  }
  // Stopping workers still count: the buffer is what absorbs them.
  bool overSoft(size_t num_more) const {
    return (numWorkers_ + num_more) * perWorker_ > softLimit_;
  }

  // CHECK-fails if the worker does not fit; callers test wouldFit() first.
  void admit();
  // CHECK-fails if no workers are accounted for.
  void release();

private:
  uint64_t hardLimit_;
  uint64_t targetBuffer_;
  uint64_t softLimit_;
  uint64_t perWorker_;
  size_t numWorkers_{0};
};

}  // namespace meganode

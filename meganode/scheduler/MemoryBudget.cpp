/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "meganode/scheduler/MemoryBudget.h"

#include <glog/logging.h>

#include "meganode/config/SchedulerConfig.h"

namespace meganode {

namespace {
uint64_t saturatingSub(uint64_t a, uint64_t b) {
  return a > b ? a - b : 0;
}
}  // anonymous namespace

MemoryBudget::MemoryBudget(
    uint64_t total_bytes,
    uint64_t overhead_bytes,
    uint64_t per_worker_bytes,
    uint64_t buffer_slots)
  : hardLimit_(saturatingSub(total_bytes, overhead_bytes)),
    targetBuffer_(buffer_slots * per_worker_bytes),
    softLimit_(saturatingSub(hardLimit_, targetBuffer_)),
    perWorker_(per_worker_bytes) {
  CHECK(perWorker_ > 0) << "Per-worker memory estimate must be positive";
}

MemoryBudget::MemoryBudget(const SchedulerConfig& config)
  : MemoryBudget(
      config.totalMemoryBytes,
      config.memoryOverheadBytes,
      config.workerMemoryBytes,
      config.workerBufferSlots
    ) {}

void MemoryBudget::admit() {
  CHECK(wouldFit(1)) << "Admitting worker " << numWorkers_ + 1
    << " would exceed the hard memory limit of " << hardLimit_;
  ++numWorkers_;
}

void MemoryBudget::release() {
  CHECK(numWorkers_ > 0) << "Released more workers than were admitted";
  --numWorkers_;
}

}  // namespace meganode

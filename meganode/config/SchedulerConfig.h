/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <chrono>
#include <cstdint>

#include <folly/dynamic.h>
#include <folly/Range.h>

#include "meganode/types/Ids.h"

namespace meganode {

// Top-level config keys
constexpr folly::StringPiece kProcessID = "process_id";
// Memory accounting
constexpr folly::StringPiece kTotalMemoryBytes = "total_memory_bytes";
constexpr folly::StringPiece kMemoryOverheadBytes = "memory_overhead_bytes";
constexpr folly::StringPiece kWorkerMemoryBytes = "worker_memory_bytes";
constexpr folly::StringPiece kWorkerBufferSlots = "worker_buffer_slots";
// Inactivity & leases
constexpr folly::StringPiece kTenantInactivitySec = "tenant_inactivity_sec";
constexpr folly::StringPiece kProcessInactivitySec = "process_inactivity_sec";
constexpr folly::StringPiece kLeaseLifetimeSec = "lease_lifetime_sec";
constexpr folly::StringPiece kLeaseRenewalIntervalSec =
  "lease_renewal_interval_sec";
// Loop cadence
constexpr folly::StringPiece kSweepIntervalMs = "sweep_interval_ms";
constexpr folly::StringPiece kEvictionWatchdogSec = "eviction_watchdog_sec";
constexpr folly::StringPiece kActivityReportIntervalMs =
  "activity_report_interval_ms";

/**
 * Immutable settings of one mega-process scheduler.  Parsed once at start
 * from a JSON object; every key except `process_id` has a default that
 * matches a 2 GiB enclave heap.
 */
class SchedulerConfig {
public:
  // Throws on any parse or validation error, reporting all of them.
  explicit SchedulerConfig(const folly::dynamic& settings);

  folly::dynamic toDynamic() const;

  ProcessID processID{0};

  uint64_t totalMemoryBytes{2ULL << 30};
  // Heap used by components shared by all tenants: network graph, thread
  // pools, connection pools, etc.
  uint64_t memoryOverheadBytes{200ULL << 20};
  // Estimated heap of one running tenant worker.
  uint64_t workerMemoryBytes{64ULL << 20};
  // Headroom kept free (in workers) for bursts, in-flight starts, and
  // workers that have not yet released their memory.
  uint64_t workerBufferSlots{2};

  std::chrono::seconds tenantInactivity{3600};
  std::chrono::seconds processInactivity{7200};
  // The fleet manager re-sends RunRequests every leaseRenewalInterval; the
  // scheduler only stores the lease, it never expires it on its own.
  std::chrono::seconds leaseLifetime{60};
  std::chrono::seconds leaseRenewalInterval{30};

  std::chrono::milliseconds sweepInterval{1000};
  // 0 disables the watchdog for workers that are slow to stop.
  std::chrono::seconds evictionWatchdog{0};
  std::chrono::milliseconds activityReportInterval{5000};
};

}  // namespace meganode

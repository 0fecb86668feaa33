/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <string>

#include <folly/dynamic.h>

namespace meganode {

// Why a worker was asked to stop.
enum class EvictCause {
  REQUEST,     // The fleet manager asked.
  INACTIVITY,  // Idle for longer than the tenant inactivity timeout.
  CAPACITY,    // Made room for a tenant that did not fit.
  PROACTIVE,   // Kept the soft memory limit.
  SHUTDOWN,    // The process is shutting down.
  EXITED,      // The worker exited on its own.
};

const char* evictCauseName(EvictCause cause);

/**
 * Monotonic counters, owned by the scheduler.  Not thread-safe.
 */
struct SchedulerStats {
  uint64_t admissions{0};
  uint64_t renewals{0};
  uint64_t denials{0};
  uint64_t misrouted{0};
  uint64_t evictionsByRequest{0};
  uint64_t evictionsByInactivity{0};
  uint64_t evictionsByCapacity{0};
  uint64_t evictionsProactive{0};
  uint64_t evictionsByShutdown{0};
  uint64_t unrequestedExits{0};
  uint64_t workerFailures{0};
  uint64_t stuckEvictions{0};
  uint64_t invariantViolations{0};

  void countEviction(EvictCause cause);
  folly::dynamic toDynamic() const;
};

}  // namespace meganode

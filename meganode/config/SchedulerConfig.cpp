/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "meganode/config/SchedulerConfig.h"

#include <limits>

#include <folly/experimental/DynamicParser.h>
#include <folly/json.h>

#include "meganode/utils/Exception.h"

namespace meganode {

namespace {

uint64_t nonNegative(int64_t n) {
  if (n < 0) {
    throw std::invalid_argument("Must be non-negative");
  }
  return static_cast<uint64_t>(n);
}

}  // anonymous namespace

SchedulerConfig::SchedulerConfig(const folly::dynamic& d_config) {
  folly::DynamicParser p(folly::DynamicParser::OnError::RECORD, &d_config);

  p.required(kProcessID, [&](int64_t n) {
    if (n < 0 || n > std::numeric_limits<ProcessID>::max()) {
      throw std::invalid_argument("Process ID out of range");
    }
    processID = static_cast<ProcessID>(n);
  });

  p.optional(kTotalMemoryBytes, [&](int64_t n) {
    totalMemoryBytes = nonNegative(n);
  });
  p.optional(kMemoryOverheadBytes, [&](int64_t n) {
    memoryOverheadBytes = nonNegative(n);
  });
  p.optional(kWorkerMemoryBytes, [&](int64_t n) {
    if (n <= 0) {
      throw std::invalid_argument("Worker memory estimate must be positive");
    }
    workerMemoryBytes = n;
  });
  p.optional(kWorkerBufferSlots, [&](int64_t n) {
    workerBufferSlots = nonNegative(n);
  });

  p.optional(kTenantInactivitySec, [&](int64_t n) {
    tenantInactivity = std::chrono::seconds(nonNegative(n));
  });
  p.optional(kProcessInactivitySec, [&](int64_t n) {
    processInactivity = std::chrono::seconds(nonNegative(n));
  });
  p.optional(kLeaseLifetimeSec, [&](int64_t n) {
    leaseLifetime = std::chrono::seconds(nonNegative(n));
  });
  p.optional(kLeaseRenewalIntervalSec, [&](int64_t n) {
    leaseRenewalInterval = std::chrono::seconds(nonNegative(n));
  });

  p.optional(kSweepIntervalMs, [&](int64_t n) {
    if (n <= 0) {
      throw std::invalid_argument("Sweep interval must be positive");
    }
    sweepInterval = std::chrono::milliseconds(n);
  });
  p.optional(kEvictionWatchdogSec, [&](int64_t n) {
    evictionWatchdog = std::chrono::seconds(nonNegative(n));
  });
  p.optional(kActivityReportIntervalMs, [&](int64_t n) {
    if (n <= 0) {
      throw std::invalid_argument("Activity report interval must be positive");
    }
    activityReportInterval = std::chrono::milliseconds(n);
  });

  auto errors = p.releaseErrors();
  if (!errors.empty()) {
    throw MeganodeException("Invalid config: ", folly::toPrettyJson(errors));
  }

  // Cross-field checks, only meaningful once every field parsed.
  if (memoryOverheadBytes >= totalMemoryBytes) {
    throw MeganodeException(
      "Invalid config: ", kMemoryOverheadBytes, " (", memoryOverheadBytes,
      ") must be below ", kTotalMemoryBytes, " (", totalMemoryBytes, ")"
    );
  }
  if (totalMemoryBytes - memoryOverheadBytes < workerMemoryBytes) {
    throw MeganodeException(
      "Invalid config: not even one worker of ", workerMemoryBytes,
      " bytes fits in the hard memory limit"
    );
  }
  if (leaseRenewalInterval >= leaseLifetime) {
    throw MeganodeException(
      "Invalid config: ", kLeaseRenewalIntervalSec, " (",
      leaseRenewalInterval.count(), ") must be shorter than ",
      kLeaseLifetimeSec, " (", leaseLifetime.count(), ")"
    );
  }
}

folly::dynamic SchedulerConfig::toDynamic() const {
  return folly::dynamic::object
    (kProcessID, processID)
    (kTotalMemoryBytes, static_cast<int64_t>(totalMemoryBytes))
    (kMemoryOverheadBytes, static_cast<int64_t>(memoryOverheadBytes))
    (kWorkerMemoryBytes, static_cast<int64_t>(workerMemoryBytes))
    (kWorkerBufferSlots, static_cast<int64_t>(workerBufferSlots))
    (kTenantInactivitySec, tenantInactivity.count())
    (kProcessInactivitySec, processInactivity.count())
    (kLeaseLifetimeSec, leaseLifetime.count())
    (kLeaseRenewalIntervalSec, leaseRenewalInterval.count())
    (kSweepIntervalMs, sweepInterval.count())
    (kEvictionWatchdogSec, evictionWatchdog.count())
    (kActivityReportIntervalMs, activityReportInterval.count());
}

}  // namespace meganode

/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "meganode/scheduler/SchedulerStats.h"

#include <glog/logging.h>

namespace meganode {

const char* evictCauseName(EvictCause cause) {
  switch (cause) {
    case EvictCause::REQUEST: return "request";
    case EvictCause::INACTIVITY: return "inactivity";
    case EvictCause::CAPACITY: return "capacity";
    case EvictCause::PROACTIVE: return "proactive";
    case EvictCause::SHUTDOWN: return "shutdown";
    case EvictCause::EXITED: return "exited";
  }
  LOG(FATAL) << "Bad EvictCause " << static_cast<int>(cause);
  return nullptr;  // Not reached
}

void SchedulerStats::countEviction(EvictCause cause) {
  switch (cause) {
    case EvictCause::REQUEST: ++evictionsByRequest; return;
    case EvictCause::INACTIVITY: ++evictionsByInactivity; return;
    case EvictCause::CAPACITY: ++evictionsByCapacity; return;
    case EvictCause::PROACTIVE: ++evictionsProactive; return;
    case EvictCause::SHUTDOWN: ++evictionsByShutdown; return;
    case EvictCause::EXITED: ++unrequestedExits; return;
  }
}

folly::dynamic SchedulerStats::toDynamic() const {
  return folly::dynamic::object
    ("admissions", admissions)
    ("renewals", renewals)
    ("denials", denials)
    ("misrouted", misrouted)
    ("evictions", folly::dynamic::object
      ("request", evictionsByRequest)
      ("inactivity", evictionsByInactivity)
      ("capacity", evictionsByCapacity)
      ("proactive", evictionsProactive)
      ("shutdown", evictionsByShutdown)
      ("exited", unrequestedExits))
    ("worker_failures", workerFailures)
    ("stuck_evictions", stuckEvictions)
    ("invariant_violations", invariantViolations);
}

}  // namespace meganode

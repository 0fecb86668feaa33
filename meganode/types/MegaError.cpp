/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "meganode/types/MegaError.h"

#include <glog/logging.h>

namespace meganode {

const char* megaErrorKindName(MegaErrorKind kind) {
  switch (kind) {
    case MegaErrorKind::AT_CAPACITY:
      return "at_capacity";
    case MegaErrorKind::WRONG_PROCESS_ID:
      return "wrong_process_id";
    case MegaErrorKind::TENANT_EVICTING:
      return "tenant_evicting";
    case MegaErrorKind::SHUTTING_DOWN:
      return "shutting_down";
    case MegaErrorKind::WORKER_FAILED:
      return "worker_failed";
  }
  LOG(FATAL) << "Unknown MegaErrorKind " << static_cast<int>(kind);
  return "";  // Unreachable
}

MegaError MegaError::atCapacity(const TenantID& tenant, size_t num_workers) {
  return MegaError(MegaErrorKind::AT_CAPACITY, folly::to<std::string>(
    "No room for tenant ", shortTenantName(tenant), " with ", num_workers,
    " workers already holding memory"
  ));
}

MegaError MegaError::wrongProcessID(ProcessID requested, ProcessID actual) {
  return MegaError(MegaErrorKind::WRONG_PROCESS_ID, folly::to<std::string>(
    "Req: ", requested, ", Actual: ", actual
  ));
}

}  // namespace meganode

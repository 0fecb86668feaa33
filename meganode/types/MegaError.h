/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <stdexcept>
#include <string>

#include <folly/Conv.h>

#include "meganode/types/Ids.h"
#include "meganode/types/TenantID.h"

namespace meganode {

enum class MegaErrorKind {
  // Admitting the tenant would exceed the hard memory limit, even after
  // evicting every eligible victim.
  AT_CAPACITY,
  // The request was addressed to a different mega-process.
  WRONG_PROCESS_ID,
  // The tenant is being stopped; retry once the stop is observed.
  TENANT_EVICTING,
  // This mega-process is shutting down and takes no new tenants.
  SHUTTING_DOWN,
  // The worker exited before it became ready.
  WORKER_FAILED,
};

const char* megaErrorKindName(MegaErrorKind kind);

/**
 * The outcome of a rejected RunRequest, delivered through the request's
 * `ready` promise.  Waiters can switch on kind() to decide whether to retry
 * elsewhere.
 */
class MegaError : public std::runtime_error {
public:
  MegaError(MegaErrorKind kind, const std::string& msg)
    : std::runtime_error(
        folly::to<std::string>(megaErrorKindName(kind), ": ", msg)
      ),
      kind_(kind) {}

  MegaErrorKind kind() const { return kind_; }

  static MegaError atCapacity(const TenantID& tenant, size_t num_workers);
  static MegaError wrongProcessID(ProcessID requested, ProcessID actual);

private:
  MegaErrorKind kind_;
};

}  // namespace meganode

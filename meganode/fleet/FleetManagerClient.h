/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <vector>

#include <folly/futures/Future.h>

#include "meganode/types/Ids.h"
#include "meganode/types/TenantID.h"

namespace meganode {

/**
 * The fleet manager decides which mega-process each tenant runs in.  It
 * wants to hear which tenants are in use, so that it renews their leases
 * here rather than placing them elsewhere.
 */
class FleetManagerClient {
public:
  virtual ~FleetManagerClient() {}

  // Must not block.  A failed report is not retried.
  virtual folly::Future<folly::Unit> reportActivity(
    ProcessID process_id,
    std::vector<TenantID> tenants
  ) = 0;
};

}  // namespace meganode

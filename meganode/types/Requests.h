/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/futures/Promise.h>

#include "meganode/types/Ids.h"
#include "meganode/types/TenantID.h"

namespace meganode {

/**
 * Asks this mega-process to run the tenant, or to keep it running (the
 * fleet manager re-sends these as lease heartbeats).  `ready` is fulfilled
 * once the tenant's worker is serving, or fails with a MegaError.  It is
 * consumed exactly once by the scheduler.
 */
struct RunRequest {
  TenantID tenant;
  LeaseID lease{0};
  ProcessID processID{0};
  // Forwarded opaquely to the worker.
  bool shutdownAfterSync{false};
  folly::Promise<folly::Unit> ready;
};

/**
 * Asks this mega-process to stop the tenant.  `stopped` is fulfilled once
 * the tenant no longer holds a slot here (immediately, if it never did).
 */
struct EvictRequest {
  TenantID tenant;
  ProcessID processID{0};
  folly::Promise<folly::Unit> stopped;
};

}  // namespace meganode

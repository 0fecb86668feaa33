/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <iostream>
#include <mutex>

#include "meganode/fleet/FleetManagerClient.h"

namespace meganode {

/**
 * Reports activity as JSON lines on a stream (stdout by default), for the
 * local supervisor that feeds the `meganode` binary its commands:
 *
 *   {"activity_report": {"process_id": 7, "tenants": ["<hex>", ...]}}
 */
class StreamFleetManagerClient : public FleetManagerClient {
public:
  explicit StreamFleetManagerClient(std::ostream& out = std::cout)
    : out_(out) {}

  folly::Future<folly::Unit> reportActivity(
    ProcessID process_id,
    std::vector<TenantID> tenants
  ) override;

private:
  std::mutex mutex_;
  std::ostream& out_;
};

}  // namespace meganode

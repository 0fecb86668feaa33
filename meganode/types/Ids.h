/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace meganode {

// Issued by the fleet manager, compared for equality only.
using LeaseID = uint32_t;
// Identifies this mega-process to the fleet manager.
using ProcessID = uint16_t;
// Distinguishes successive workers spawned for the same tenant.
using InvocationID = uint64_t;

// All scheduler timestamps are milliseconds since the epoch.
using Timestamp = std::chrono::milliseconds;

inline Timestamp systemNow() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch());
}

}  // namespace meganode

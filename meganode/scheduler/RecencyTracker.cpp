/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "meganode/scheduler/RecencyTracker.h"

#include <algorithm>

namespace meganode {

Timestamp RecencyTracker::touch(const TenantID& tenant, Timestamp now) {
  if (!order_.empty()) {
    now = std::max(now, order_.back().lastActive);
  }
  auto it = index_.find(tenant);
  if (it == index_.end()) {
    order_.push_back(Item{tenant, now});
    index_.emplace(tenant, std::prev(order_.end()));
    return now;
  }
  it->second->lastActive = now;
  order_.splice(order_.end(), order_, it->second);
  return now;
}

bool RecencyTracker::remove(const TenantID& tenant) {
  auto it = index_.find(tenant);
  if (it == index_.end()) {
    return false;
  }
  order_.erase(it->second);
  index_.erase(it);
  return true;
}

std::vector<TenantID> RecencyTracker::leastRecentN(size_t n) const {
  std::vector<TenantID> out;
  out.reserve(std::min(n, order_.size()));
  for (auto it = order_.begin(); it != order_.end() && out.size() < n; ++it) {
    out.push_back(it->tenant);
  }
  return out;
}

folly::Optional<Timestamp> RecencyTracker::lastActive(
    const TenantID& tenant) const {
  auto it = index_.find(tenant);
  if (it == index_.end()) {
    return folly::none;
  }
  return it->second->lastActive;
}

}  // namespace meganode

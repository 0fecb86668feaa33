/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <list>
#include <unordered_map>
#include <vector>

#include <folly/Optional.h>

#include "meganode/types/Ids.h"
#include "meganode/types/TenantID.h"

namespace meganode {

/**
 * An LRU index of tenants by last observed activity.  Iteration goes from
 * the least to the most recently touched tenant; ties keep their touch
 * order.  All operations are O(1) except leastRecentN().
 *
 * NOT thread-safe, owned by the scheduler loop.
 */
class RecencyTracker {
public:
  struct Item {
    TenantID tenant;
    Timestamp lastActive;
  };
  using const_iterator = std::list<Item>::const_iterator;

  // Inserts the tenant, or moves it to the most-recently-used end.  The
  // recorded time never decreases, even if the clock jumps back, so the
  // iteration order is also ordered by lastActive.  Returns the recorded
  // time.
  Timestamp touch(const TenantID& tenant, Timestamp now);

  // Returns false if the tenant was not tracked.
  bool remove(const TenantID& tenant);

  // Up to n eviction candidates, oldest first.
  std::vector<TenantID> leastRecentN(size_t n) const;

  folly::Optional<Timestamp> lastActive(const TenantID& tenant) const;
  bool contains(const TenantID& tenant) const {
    return index_.count(tenant) != 0;
  }

  bool empty() const { return order_.empty(); }
  size_t size() const { return order_.size(); }

  const_iterator begin() const { return order_.begin(); }
  const_iterator end() const { return order_.end(); }

private:
  std::list<Item> order_;  // Front is the least recently used.
  std::unordered_map<TenantID, std::list<Item>::iterator> index_;
};

}  // namespace meganode

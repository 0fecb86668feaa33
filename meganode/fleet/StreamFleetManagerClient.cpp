/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "meganode/fleet/StreamFleetManagerClient.h"

#include <folly/json.h>

#include "meganode/utils/Exception.h"

namespace meganode {

folly::Future<folly::Unit> StreamFleetManagerClient::reportActivity(
    ProcessID process_id,
    std::vector<TenantID> tenants) {
  folly::dynamic d_tenants = folly::dynamic::array;
  for (const auto& t : tenants) {
    d_tenants.push_back(t.toHex());
  }
  auto line = folly::toJson(folly::dynamic::object
    ("activity_report", folly::dynamic::object
      ("process_id", process_id)
      ("tenants", std::move(d_tenants))));

  std::lock_guard<std::mutex> lock(mutex_);
  out_ << line << std::endl;
  if (!out_) {
    return folly::makeFuture<folly::Unit>(
      MeganodeException("Failed to write the activity report")
    );
  }
  return folly::makeFuture();
}

}  // namespace meganode

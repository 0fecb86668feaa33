/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "meganode/utils/HelperTasks.h"

#include <algorithm>

#include <folly/futures/Future.h>
#include <glog/logging.h>

namespace meganode {

void HelperTasks::add(std::string name, folly::Future<folly::Unit> f) {
  auto num_failed = numFailed_;
  auto logged = std::move(f).thenTry(
    [name, num_failed](folly::Try<folly::Unit>&& t) noexcept {
      if (t.hasException()) {
        LOG(WARNING) << "Helper task " << name << " failed: "
          << t.exception().what();
        ++*num_failed;
      } else {
        VLOG(1) << "Helper task " << name << " done";
      }
    }
  );
  auto tasks = tasks_.wlock();
  // Forget the finished tasks, so the list stays short.
  tasks->erase(
    std::remove_if(tasks->begin(), tasks->end(), [](
      const folly::Future<folly::Unit>& t
    ) { return t.isReady(); }),
    tasks->end()
  );
  tasks->emplace_back(std::move(logged));
}

folly::Future<folly::Unit> HelperTasks::joinAll() {
  std::vector<folly::Future<folly::Unit>> tasks;
  tasks_.wlock()->swap(tasks);
  // The tasks log their own errors, and never fail.
  return folly::collectAllSemiFuture(tasks).toUnsafeFuture().thenValue(
    [](std::vector<folly::Try<folly::Unit>>&&) noexcept {}
  );
}

size_t HelperTasks::numPending() {
  size_t n = 0;
  for (const auto& t : *tasks_.rlock()) {
    if (!t.isReady()) {
      ++n;
    }
  }
  return n;
}

}  // namespace meganode

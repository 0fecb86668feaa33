/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <folly/futures/Promise.h>

#include "meganode/utils/HelperTasks.h"

using namespace meganode;

TEST(TestHelperTasks, JoinWaitsForAllAndCountsFailures) {
  HelperTasks tasks;
  folly::Promise<folly::Unit> slow;
  tasks.add("done", folly::makeFuture());
  tasks.add("broken", folly::makeFuture<folly::Unit>(
    std::runtime_error("no route to fleet manager")
  ));
  tasks.sink()("slow", slow.getFuture());
  EXPECT_EQ(1, tasks.numPending());
  EXPECT_EQ(1, tasks.numFailed());

  auto joined = tasks.joinAll();
  EXPECT_FALSE(joined.isReady());
  slow.setException(std::runtime_error("timed out"));
  EXPECT_TRUE(joined.isReady());
  EXPECT_EQ(2, tasks.numFailed());
  EXPECT_EQ(0, tasks.numPending());
}

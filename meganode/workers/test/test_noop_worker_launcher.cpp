/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include "meganode/workers/NoOpWorkerLauncher.h"

using namespace meganode;

TEST(TestNoOpWorkerLauncher, ReadyAtOnceExitsOnStop) {
  NoOpWorkerLauncher launcher;
  WorkerSpec spec;
  spec.tenant = TenantID::fromU64(1);
  size_t num_ready = 0;
  auto worker = launcher.launch(spec, [&]() { ++num_ready; });
  EXPECT_EQ(1, num_ready);
  auto done = worker->completion();
  EXPECT_FALSE(done.isReady());
  worker->requestStop();
  worker->requestStop();
  ASSERT_TRUE(done.isReady());
  EXPECT_FALSE(done.hasException());
}

TEST(TestNoOpWorkerLauncher, ShutdownAfterSync) {
  NoOpWorkerLauncher launcher;
  WorkerSpec spec;
  spec.tenant = TenantID::fromU64(2);
  spec.shutdownAfterSync = true;
  size_t num_ready = 0;
  auto worker = launcher.launch(spec, [&]() { ++num_ready; });
  EXPECT_EQ(1, num_ready);
  EXPECT_TRUE(worker->completion().isReady());
}

/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include "meganode/config/SchedulerConfig.h"
#include "meganode/scheduler/MemoryBudget.h"

using namespace meganode;

constexpr uint64_t kMiB = 1ULL << 20;

TEST(TestMemoryBudget, DefaultDeployment) {
  MemoryBudget b(SchedulerConfig(folly::dynamic::object(kProcessID, 1)));
  EXPECT_EQ(2048 * kMiB - 200 * kMiB, b.hardLimit());
  EXPECT_EQ(128 * kMiB, b.targetBuffer());
  EXPECT_EQ(b.hardLimit() - 128 * kMiB, b.softLimit());
  EXPECT_EQ(64 * kMiB, b.perWorker());
  // 1848 MiB / 64 MiB
  EXPECT_EQ(28, b.maxWorkers());
  EXPECT_EQ(0, b.numWorkers());
  EXPECT_EQ(0, b.currentMemory());
}

TEST(TestMemoryBudget, SoftAndHardLimits) {
  // Hard limit fits 5 workers; the soft limit keeps 2 slots free.
  MemoryBudget b(600, 100, 100, 2);
  EXPECT_EQ(500, b.hardLimit());
  EXPECT_EQ(300, b.softLimit());

  for (int i = 0; i < 3; ++i) {
    EXPECT_FALSE(b.overSoft(1));
    ASSERT_TRUE(b.wouldFit(1));
    b.admit();
  }
  EXPECT_EQ(300, b.currentMemory());
  // The 4th worker would cross the soft limit, but still fits.
  EXPECT_TRUE(b.overSoft(1));
  EXPECT_TRUE(b.wouldFit(1));
  EXPECT_TRUE(b.wouldFit(2));
  EXPECT_FALSE(b.wouldFit(3));

  b.admit();
  b.admit();
  EXPECT_EQ(5, b.numWorkers());
  EXPECT_FALSE(b.wouldFit(1));
  EXPECT_TRUE(b.wouldFit(0));

  b.release();
  EXPECT_TRUE(b.wouldFit(1));
  EXPECT_EQ(400, b.currentMemory());
}

TEST(TestMemoryBudget, BufferLargerThanHeap) {
  MemoryBudget b(300, 100, 100, 5);
  EXPECT_EQ(200, b.hardLimit());
  EXPECT_EQ(0, b.softLimit());
  // Every admission is over the soft limit, but the hard limit rules.
  EXPECT_TRUE(b.overSoft(1));
  EXPECT_TRUE(b.wouldFit(2));
}

TEST(TestMemoryBudgetDeathTest, NoOverAdmission) {
  MemoryBudget b(200, 0, 100, 0);
  b.admit();
  b.admit();
  EXPECT_DEATH(b.admit(), "hard memory limit");
}

TEST(TestMemoryBudgetDeathTest, NoOverRelease) {
  MemoryBudget b(200, 0, 100, 0);
  EXPECT_DEATH(b.release(), "Released more workers");
}

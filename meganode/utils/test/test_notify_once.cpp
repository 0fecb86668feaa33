/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "meganode/utils/NotifyOnce.h"

using namespace meganode;

TEST(TestNotifyOnce, FiresOnce) {
  NotifyOnce n;
  auto before = n.recv();
  EXPECT_FALSE(n.isSent());
  EXPECT_FALSE(before.isReady());

  EXPECT_TRUE(n.send());
  EXPECT_TRUE(n.isSent());
  EXPECT_TRUE(before.isReady());
  // A late subscriber sees the signal too.
  EXPECT_TRUE(n.recv().isReady());

  EXPECT_FALSE(n.send());
}

TEST(TestNotifyOnce, CopiesShareState) {
  NotifyOnce a;
  NotifyOnce b = a;
  EXPECT_TRUE(b.send());
  EXPECT_TRUE(a.isSent());
  EXPECT_FALSE(a.send());
}

TEST(TestNotifyOnce, ConcurrentSendersFireExactlyOnce) {
  NotifyOnce n;
  std::atomic<int> num_fired{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&]() {
      if (n.send()) {
        ++num_fired;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(1, num_fired.load());
  EXPECT_TRUE(n.recv().isReady());
}

/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <unordered_set>

#include <folly/ExceptionWrapper.h>
#include <folly/futures/Future.h>

#include "meganode/types/MegaError.h"
#include "meganode/types/TenantID.h"

using namespace meganode;

TEST(TestTenantID, HexAndNumbers) {
  auto id = TenantID::fromU64(0x0102);
  EXPECT_EQ(std::string(60, '0') + "0102", id.toHex());
  EXPECT_EQ(id, TenantID::fromHex(id.toHex()));
  EXPECT_EQ("0000000000000000", shortTenantName(id));
  EXPECT_NE(TenantID::fromU64(1), TenantID::fromU64(2));
  EXPECT_LT(TenantID::fromU64(1), TenantID::fromU64(2));

  std::unordered_set<TenantID> ids;
  for (uint64_t i = 0; i < 100; ++i) {
    ids.insert(TenantID::fromU64(i));
  }
  ids.insert(TenantID::fromU64(7));
  EXPECT_EQ(100, ids.size());
}

TEST(TestTenantID, BadHex) {
  EXPECT_THROW(TenantID::fromHex("abcd"), std::runtime_error);
  EXPECT_THROW(TenantID::fromHex(std::string(64, 'z')), std::runtime_error);
}

TEST(TestMegaError, CarriesKind) {
  auto f = folly::makeFuture<folly::Unit>(
    MegaError::wrongProcessID(3, 4)
  );
  try {
    std::move(f).get();
    FAIL() << "Expected a MegaError";
  } catch (const MegaError& e) {
    EXPECT_EQ(MegaErrorKind::WRONG_PROCESS_ID, e.kind());
    EXPECT_STREQ("wrong_process_id: Req: 3, Actual: 4", e.what());
  }
  EXPECT_EQ(
    MegaErrorKind::AT_CAPACITY,
    MegaError::atCapacity(TenantID::fromU64(1), 5).kind()
  );
}

/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "meganode/types/TenantID.h"

#include <ostream>

#include <folly/String.h>
#include <folly/hash/Hash.h>

#include "meganode/utils/Exception.h"

namespace meganode {

TenantID TenantID::fromHex(folly::StringPiece hex) {
  if (hex.size() != 2 * kNumBytes) {
    throw MeganodeException(
      "Tenant ID must have ", 2 * kNumBytes, " hex characters, got ",
      hex.size()
    );
  }
  std::string raw;
  if (!folly::unhexlify(hex, raw)) {
    throw MeganodeException("Tenant ID is not valid hex: ", hex);
  }
  Bytes bytes;
  std::copy(raw.begin(), raw.end(), bytes.begin());
  return TenantID(bytes);
}

TenantID TenantID::fromU64(uint64_t n) {
  Bytes bytes{};
  for (size_t i = 0; i < sizeof(n); ++i) {
    bytes[kNumBytes - 1 - i] = static_cast<uint8_t>(n >> (8 * i));
  }
  return TenantID(bytes);
}

std::string TenantID::toHex() const {
  return folly::hexlify(folly::ByteRange(bytes_.data(), bytes_.size()));
}

size_t TenantID::hash() const {
  return folly::hash::fnv64_buf(bytes_.data(), bytes_.size());
}

std::ostream& operator<<(std::ostream& os, const TenantID& id) {
  return os << id.toHex();
}

std::string shortTenantName(const TenantID& id) {
  return id.toHex().substr(0, 16);
}

}  // namespace meganode

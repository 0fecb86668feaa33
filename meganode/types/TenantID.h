/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>

#include <folly/Range.h>

namespace meganode {

/**
 * Identifies a user whose node may run in this process.  Externally, this
 * is the user's 256-bit public key; the scheduler only compares, hashes
 * and prints it.
 */
class TenantID {
public:
  static constexpr size_t kNumBytes = 32;
  using Bytes = std::array<uint8_t, kNumBytes>;

  TenantID() : bytes_{} {}
  explicit TenantID(const Bytes& bytes) : bytes_(bytes) {}

  // Throws unless given exactly 64 hex characters.
  static TenantID fromHex(folly::StringPiece hex);
  // Big-endian in the trailing 8 bytes, zeros elsewhere.  Handy for tests
  // and for tools that number their tenants.
  static TenantID fromU64(uint64_t n);

  const Bytes& bytes() const { return bytes_; }
  std::string toHex() const;

  bool operator==(const TenantID& o) const { return bytes_ == o.bytes_; }
  bool operator!=(const TenantID& o) const { return bytes_ != o.bytes_; }
  bool operator<(const TenantID& o) const { return bytes_ < o.bytes_; }

  size_t hash() const;

private:
  Bytes bytes_;
};

std::ostream& operator<<(std::ostream& os, const TenantID& id);

// Lets folly::to<std::string>() print the full hex.
template <class Tgt>
void toAppend(const TenantID& id, Tgt* result) {
  result->append(id.toHex());
}

// Renders as a truncated hex prefix, since full keys make logs unreadable.
std::string shortTenantName(const TenantID& id);

}  // namespace meganode

namespace std {
template <>
struct hash<meganode::TenantID> {
  size_t operator()(const meganode::TenantID& id) const { return id.hash(); }
};
}  // namespace std

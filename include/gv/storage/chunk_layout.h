#pragma once

#include <cstdint>
#include <string>

#include "gv/crypto/tree_hash.h"
#include "gv/error.h"
#include "gv/errors.h"

namespace gv::storage {

constexpr uint64_t kMiB = 1024 * 1024;
constexpr uint64_t kMinPartSize = crypto::kTreeHashLeafSize;
constexpr uint64_t kMaxPartSize = 4096 * kMiB;
constexpr uint64_t kDefaultPartSize = 2 * kMiB;

// Multipart parts are 1 MiB times a power of two, at most 4 GiB. This keeps
// every part boundary on a tree-hash subtree boundary.
[[nodiscard]] constexpr bool IsValidPartSize(uint64_t part_size) noexcept {
  if (part_size < kMinPartSize || part_size > kMaxPartSize || part_size % kMinPartSize != 0) {
    return false;
  }
  const uint64_t leaves = part_size / kMinPartSize;
  return (leaves & (leaves - 1)) == 0;
}

inline void ValidatePartSize(uint64_t part_size) {
  if (!IsValidPartSize(part_size)) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidPartSize,
                std::string(errors::msg::kInvalidPartSize) + ": " + std::to_string(part_size));
  }
}

// Backend byte-range header for an inclusive range. An empty range renders
// with end == start - 1.
inline std::string FormatByteRange(int64_t start, int64_t end_inclusive) {
  return "bytes " + std::to_string(start) + "-" + std::to_string(end_inclusive) + "/*";
}

}  // namespace gv::storage

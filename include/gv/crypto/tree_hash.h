#pragma once
#include <array>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace gv::crypto {

inline constexpr size_t kTreeHashLeafSize = 1024 * 1024;

using TreeDigest = std::array<uint8_t, 32>;

// SHA-256 over 1 MiB leaves, reduced pairwise until one digest remains. An odd
// trailing digest is carried up unchanged. Empty input hashes to SHA-256("").
class TreeHasher {
public:
  void Update(std::span<const uint8_t> data);
  // Resets the hasher after producing the root.
  TreeDigest Finish();
  std::string FinishHex();

  [[nodiscard]] uint64_t bytes_consumed() const noexcept { return total_; }

private:
  std::vector<uint8_t> pending_;
  std::vector<TreeDigest> leaves_;
  uint64_t total_{0};
};

// Reduces subtree roots into one root. Equal to the tree hash of the
// concatenated data when every subtree but the last covers 2^k leaves.
TreeDigest CombineTreeHashes(std::span<const TreeDigest> roots);

TreeDigest TreeHash(std::span<const uint8_t> data);
std::string TreeHashHex(std::span<const uint8_t> data);
std::string TreeHashFileHex(const std::filesystem::path& path);

}  // namespace gv::crypto

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "gv/core/stream_cipher.h"
#include "gv/crypto/tree_hash.h"

namespace gv::storage {

// One multipart transfer unit. Plain offsets are inclusive; an empty range has
// plain_end == plain_start - 1. Transfer coordinates are the offsets of the
// bytes actually sent, which differ from plain offsets once a cipher is set.
class EncryptedChunk {
public:
  EncryptedChunk(std::filesystem::path file_path, uint64_t target_part_size, uint64_t part_index,
                 int64_t plain_start, int64_t plain_end,
                 std::shared_ptr<const core::StreamCipher> cipher);

  EncryptedChunk(const EncryptedChunk&) = delete;
  EncryptedChunk& operator=(const EncryptedChunk&) = delete;

  const std::filesystem::path& file_path() const noexcept { return file_path_; }
  uint64_t target_part_size() const noexcept { return target_part_size_; }
  uint64_t part_index() const noexcept { return part_index_; }
  int64_t plain_start() const noexcept { return plain_start_; }
  int64_t plain_end() const noexcept { return plain_end_; }
  uint64_t plain_size() const noexcept { return static_cast<uint64_t>(plain_end_ - plain_start_ + 1); }
  bool encrypted() const noexcept { return cipher_ != nullptr; }

  uint64_t transfer_size() const noexcept;
  int64_t transfer_start() const noexcept;
  int64_t transfer_end() const noexcept;
  std::string ByteRange() const;

  bool completed() const;
  std::optional<std::string> cached_checksum() const;
  bool has_buffer() const;

  // Reads (and encrypts, with a cipher) this range through its own file handle.
  // The buffer is kept until MarkCompleted or ReleaseBuffer. Rebuilding an
  // encrypted buffer draws a new nonce base, so a stale checksum is dropped.
  std::shared_ptr<const std::vector<uint8_t>> Data();
  // Tree hash of Data(), computed once and cached.
  std::string Checksum();

  // Sets completed, releases the buffer and keeps the checksum.
  void MarkCompleted();
  void ReleaseBuffer();

  nlohmann::json ToJson() const;
  static std::unique_ptr<EncryptedChunk> FromJson(const nlohmann::json& value,
                                                  std::shared_ptr<const core::StreamCipher> cipher);

private:
  std::shared_ptr<const std::vector<uint8_t>> LoadLocked();

  std::filesystem::path file_path_;
  uint64_t target_part_size_;
  uint64_t part_index_;
  int64_t plain_start_;
  int64_t plain_end_;
  std::shared_ptr<const core::StreamCipher> cipher_;

  mutable std::mutex mutex_;
  bool completed_{false};
  std::optional<std::string> checksum_;
  std::shared_ptr<const std::vector<uint8_t>> buffer_;
};

using ChunkList = std::vector<std::unique_ptr<EncryptedChunk>>;

class ChunkPlanner {
public:
  // Plaintext bytes per part: the part size itself, or the plaintext that
  // encrypts to exactly one part.
  static uint64_t StepSize(uint64_t target_part_size, bool encrypted);

  // Splits the file into consecutive parts covering [0, size). When the size is
  // a multiple of the step (zero included) an empty-range part closes the plan.
  static ChunkList Plan(const std::filesystem::path& file_path, uint64_t target_part_size,
                        std::shared_ptr<const core::StreamCipher> cipher);
};

}  // namespace gv::storage

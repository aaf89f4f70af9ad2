#include "gv/storage/chunk_planner.h"

#include <algorithm>
#include <fstream>
#include <system_error>

#include "gv/common.h"
#include "gv/error.h"
#include "gv/errors.h"
#include "gv/storage/chunk_layout.h"

namespace gv::storage {

namespace {

[[noreturn]] void ThrowSourceError(int code, const std::filesystem::path& path, const std::string& detail) {
  throw Error(ErrorDomain::IO, code,
              std::string(errors::msg::kSourceUnreadable) + ": " + PathToUtf8String(path) + " (" +
                  detail + ")");
}

}  // namespace

EncryptedChunk::EncryptedChunk(std::filesystem::path file_path, uint64_t target_part_size,
                               uint64_t part_index, int64_t plain_start, int64_t plain_end,
                               std::shared_ptr<const core::StreamCipher> cipher)
    : file_path_(std::move(file_path)),
      target_part_size_(target_part_size),
      part_index_(part_index),
      plain_start_(plain_start),
      plain_end_(plain_end),
      cipher_(std::move(cipher)) {
  if (plain_start_ < 0 || plain_end_ < plain_start_ - 1 ||
      plain_end_ - plain_start_ >= static_cast<int64_t>(target_part_size_) ||
      transfer_size() > target_part_size_) {
    throw Error(ErrorDomain::Internal, 0,
                "Chunk range does not fit its part size: " + std::to_string(plain_start_) + "-" +
                    std::to_string(plain_end_) + " in " + std::to_string(target_part_size_));
  }
}

uint64_t EncryptedChunk::transfer_size() const noexcept {
  return cipher_ ? core::StreamCipher::EncryptedSize(plain_size()) : plain_size();
}

int64_t EncryptedChunk::transfer_start() const noexcept {
  return static_cast<int64_t>(part_index_ * target_part_size_);
}

int64_t EncryptedChunk::transfer_end() const noexcept {
  return transfer_start() + static_cast<int64_t>(transfer_size()) - 1;
}

std::string EncryptedChunk::ByteRange() const {
  return FormatByteRange(transfer_start(), transfer_end());
}

bool EncryptedChunk::completed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return completed_;
}

std::optional<std::string> EncryptedChunk::cached_checksum() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return checksum_;
}

bool EncryptedChunk::has_buffer() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffer_ != nullptr;
}

std::shared_ptr<const std::vector<uint8_t>> EncryptedChunk::LoadLocked() {
  if (buffer_) {
    return buffer_;
  }
  std::ifstream in(file_path_, std::ios::binary);
  if (!in) {
    ThrowSourceError(errors::io::kOpenFailed, file_path_, "open");
  }
  in.seekg(plain_start_);
  if (!in) {
    ThrowSourceError(errors::io::kReadFailed, file_path_, "seek");
  }

  std::vector<uint8_t> bytes;
  if (cipher_) {
    bytes = cipher_->Encrypt(in, plain_size()).ReadAll();
  } else {
    bytes.resize(static_cast<size_t>(plain_size()));
    in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (in.bad()) {
      ThrowSourceError(errors::io::kReadFailed, file_path_, "read");
    }
    bytes.resize(static_cast<size_t>(in.gcount()));
  }
  if (bytes.size() != transfer_size()) {
    ThrowSourceError(errors::io::kReadFailed, file_path_, "file shorter than planned");
  }
  if (cipher_ && !completed_) {
    checksum_.reset();
  }
  buffer_ = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
  return buffer_;
}

std::shared_ptr<const std::vector<uint8_t>> EncryptedChunk::Data() {
  std::lock_guard<std::mutex> lock(mutex_);
  return LoadLocked();
}

std::string EncryptedChunk::Checksum() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!checksum_) {
    auto data = LoadLocked();
    checksum_ = crypto::TreeHashHex(*data);
  }
  if (completed_) {
    buffer_.reset();
  }
  return *checksum_;
}

void EncryptedChunk::MarkCompleted() {
  std::lock_guard<std::mutex> lock(mutex_);
  completed_ = true;
  buffer_.reset();
}

void EncryptedChunk::ReleaseBuffer() {
  std::lock_guard<std::mutex> lock(mutex_);
  buffer_.reset();
}

nlohmann::json EncryptedChunk::ToJson() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return nlohmann::json{
      {"file_path", PathToUtf8String(file_path_)},
      {"part_size", target_part_size_},
      {"part_index", part_index_},
      {"plain_start", plain_start_},
      {"plain_end", plain_end_},
      {"completed", completed_},
      {"checksum", checksum_ ? nlohmann::json(*checksum_) : nlohmann::json(nullptr)},
  };
}

std::unique_ptr<EncryptedChunk> EncryptedChunk::FromJson(const nlohmann::json& value,
                                                         std::shared_ptr<const core::StreamCipher> cipher) {
  try {
    auto chunk = std::make_unique<EncryptedChunk>(
        std::filesystem::u8path(value.at("file_path").get<std::string>()),
        value.at("part_size").get<uint64_t>(), value.at("part_index").get<uint64_t>(),
        value.at("plain_start").get<int64_t>(), value.at("plain_end").get<int64_t>(),
        std::move(cipher));
    chunk->completed_ = value.at("completed").get<bool>();
    const auto& checksum = value.at("checksum");
    if (!checksum.is_null()) {
      chunk->checksum_ = checksum.get<std::string>();
    }
    return chunk;
  } catch (const nlohmann::json::exception& ex) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidSnapshot,
                std::string(errors::msg::kSnapshotMalformed) + ": " + ex.what());
  }
}

uint64_t ChunkPlanner::StepSize(uint64_t target_part_size, bool encrypted) {
  return encrypted ? core::StreamCipher::UnencryptedBlockSize(target_part_size) : target_part_size;
}

ChunkList ChunkPlanner::Plan(const std::filesystem::path& file_path, uint64_t target_part_size,
                             std::shared_ptr<const core::StreamCipher> cipher) {
  ValidatePartSize(target_part_size);
  const uint64_t step = StepSize(target_part_size, cipher != nullptr);

  std::error_code ec;
  const auto total = std::filesystem::file_size(file_path, ec);
  if (ec) {
    throw Error(ErrorDomain::IO, errors::io::kOpenFailed,
                std::string(errors::msg::kSourceUnreadable) + ": " + PathToUtf8String(file_path),
                ec.value());
  }

  ChunkList chunks;
  chunks.reserve(static_cast<size_t>(total / step + 2));
  uint64_t position = 0;
  uint64_t index = 0;
  while (position <= total) {
    const uint64_t end = std::min(position + step, total);
    chunks.push_back(std::make_unique<EncryptedChunk>(file_path, target_part_size, index++,
                                                      static_cast<int64_t>(position),
                                                      static_cast<int64_t>(end) - 1, cipher));
    // A short or empty part ends the plan; a full part ending at EOF is
    // followed by one empty boundary part.
    if (end - position < step) {
      break;
    }
    position = end;
  }
  return chunks;
}

}  // namespace gv::storage

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "gv/core/stream_cipher.h"
#include "gv/storage/chunk_planner.h"

namespace gv::orchestrator {

inline constexpr int kSnapshotVersion = 1;

enum class UploadState { kUnstarted, kInitialized, kUploading, kFinalized, kFailed };

std::string_view UploadStateName(UploadState state);
std::optional<UploadState> ParseUploadState(std::string_view name);

// Everything needed to continue a multipart upload, minus key material. The
// cipher is held for chunk encryption but never serialized.
class UploadSession {
public:
  // Plans the file into parts right away.
  static UploadSession Create(std::string vault, std::filesystem::path file_path, uint64_t part_size,
                              std::string description,
                              std::shared_ptr<const core::StreamCipher> cipher = nullptr);

  // An encrypted snapshot needs the cipher it was created with.
  static UploadSession FromSnapshot(const nlohmann::json& snapshot,
                                    std::shared_ptr<const core::StreamCipher> cipher = nullptr);
  nlohmann::json ToSnapshot() const;

  UploadSession(UploadSession&&) noexcept = default;
  UploadSession& operator=(UploadSession&&) noexcept = default;

  const std::string& vault() const noexcept { return vault_; }
  const std::filesystem::path& file_path() const noexcept { return file_path_; }
  uint64_t part_size() const noexcept { return part_size_; }
  const std::string& description() const noexcept { return description_; }
  bool encrypted() const noexcept { return cipher_ != nullptr; }
  const std::shared_ptr<const core::StreamCipher>& cipher() const noexcept { return cipher_; }

  UploadState state() const noexcept { return state_; }
  const std::optional<std::string>& upload_id() const noexcept { return upload_id_; }
  const std::optional<std::string>& archive_id() const noexcept { return archive_id_; }

  storage::ChunkList& chunks() noexcept { return chunks_; }
  const storage::ChunkList& chunks() const noexcept { return chunks_; }
  size_t completed_count() const;
  bool all_completed() const;

  // Raw backend interactions keyed by step: "initialize", "upload" (array), "finalize".
  nlohmann::json& responses() noexcept { return responses_; }
  const nlohmann::json& responses() const noexcept { return responses_; }

private:
  friend class UploadOrchestrator;

  UploadSession() = default;

  std::string vault_;
  std::filesystem::path file_path_;
  uint64_t part_size_{0};
  std::string description_;
  std::shared_ptr<const core::StreamCipher> cipher_;

  UploadState state_{UploadState::kUnstarted};
  std::optional<std::string> upload_id_;
  std::optional<std::string> archive_id_;
  storage::ChunkList chunks_;
  nlohmann::json responses_ = nlohmann::json::object();
};

}  // namespace gv::orchestrator

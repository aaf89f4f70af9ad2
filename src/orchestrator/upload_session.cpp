#include "gv/orchestrator/upload_session.h"

#include <algorithm>
#include <array>
#include <utility>

#include "gv/common.h"
#include "gv/error.h"
#include "gv/errors.h"
#include "gv/storage/chunk_layout.h"

namespace gv::orchestrator {

namespace {

constexpr std::array<std::pair<UploadState, std::string_view>, 5> kStateNames{{
    {UploadState::kUnstarted, "unstarted"},
    {UploadState::kInitialized, "initialized"},
    {UploadState::kUploading, "uploading"},
    {UploadState::kFinalized, "finalized"},
    {UploadState::kFailed, "failed"},
}};

nlohmann::json OptionalString(const std::optional<std::string>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<std::string> ReadOptionalString(const nlohmann::json& value, const char* key) {
  const auto& field = value.at(key);
  if (field.is_null()) {
    return std::nullopt;
  }
  return field.get<std::string>();
}

[[noreturn]] void ThrowSnapshotError(const std::string& detail) {
  throw Error(ErrorDomain::Config, errors::config::kInvalidSnapshot,
              std::string(errors::msg::kSnapshotMalformed) + ": " + detail);
}

}  // namespace

std::string_view UploadStateName(UploadState state) {
  for (const auto& [value, name] : kStateNames) {
    if (value == state) {
      return name;
    }
  }
  return "unknown";
}

std::optional<UploadState> ParseUploadState(std::string_view name) {
  for (const auto& [value, candidate] : kStateNames) {
    if (candidate == name) {
      return value;
    }
  }
  return std::nullopt;
}

UploadSession UploadSession::Create(std::string vault, std::filesystem::path file_path, uint64_t part_size,
                                    std::string description,
                                    std::shared_ptr<const core::StreamCipher> cipher) {
  UploadSession session;
  session.vault_ = std::move(vault);
  session.file_path_ = std::move(file_path);
  session.part_size_ = part_size;
  session.description_ = std::move(description);
  session.cipher_ = std::move(cipher);
  session.chunks_ = storage::ChunkPlanner::Plan(session.file_path_, part_size, session.cipher_);
  return session;
}

size_t UploadSession::completed_count() const {
  return static_cast<size_t>(std::count_if(chunks_.begin(), chunks_.end(),
                                           [](const auto& chunk) { return chunk->completed(); }));
}

bool UploadSession::all_completed() const {
  return std::all_of(chunks_.begin(), chunks_.end(), [](const auto& chunk) { return chunk->completed(); });
}

nlohmann::json UploadSession::ToSnapshot() const {
  nlohmann::json chunks = nlohmann::json::array();
  for (const auto& chunk : chunks_) {
    chunks.push_back(chunk->ToJson());
  }
  return nlohmann::json{
      {"version", kSnapshotVersion},
      {"vault", vault_},
      {"file_path", PathToUtf8String(file_path_)},
      {"part_size", part_size_},
      {"description", description_},
      {"upload_id", OptionalString(upload_id_)},
      {"archive_id", OptionalString(archive_id_)},
      {"state", std::string(UploadStateName(state_))},
      {"encrypted", encrypted()},
      {"chunks", std::move(chunks)},
      {"responses", responses_},
  };
}

UploadSession UploadSession::FromSnapshot(const nlohmann::json& snapshot,
                                          std::shared_ptr<const core::StreamCipher> cipher) {
  UploadSession session;
  try {
    const auto version = snapshot.at("version").get<int>();
    if (version != kSnapshotVersion) {
      ThrowSnapshotError("unsupported version " + std::to_string(version));
    }
    const bool was_encrypted = snapshot.at("encrypted").get<bool>();
    if (was_encrypted && !cipher) {
      throw Error(ErrorDomain::Config, errors::config::kMissingCipher,
                  std::string(errors::msg::kSnapshotMissingCipher));
    }
    if (!was_encrypted && cipher) {
      ThrowSnapshotError("snapshot was taken without encryption");
    }
    session.vault_ = snapshot.at("vault").get<std::string>();
    session.file_path_ = std::filesystem::u8path(snapshot.at("file_path").get<std::string>());
    session.part_size_ = snapshot.at("part_size").get<uint64_t>();
    storage::ValidatePartSize(session.part_size_);
    session.description_ = snapshot.at("description").get<std::string>();
    session.upload_id_ = ReadOptionalString(snapshot, "upload_id");
    session.archive_id_ = ReadOptionalString(snapshot, "archive_id");
    const auto state_name = snapshot.at("state").get<std::string>();
    const auto state = ParseUploadState(state_name);
    if (!state) {
      ThrowSnapshotError("unknown state '" + state_name + "'");
    }
    session.state_ = *state;
    session.cipher_ = std::move(cipher);
    for (const auto& chunk : snapshot.at("chunks")) {
      auto restored = storage::EncryptedChunk::FromJson(chunk, session.cipher_);
      if (restored->target_part_size() != session.part_size_ ||
          restored->part_index() != session.chunks_.size()) {
        ThrowSnapshotError("chunk list out of order");
      }
      session.chunks_.push_back(std::move(restored));
    }
    if (session.chunks_.empty()) {
      ThrowSnapshotError("no chunks");
    }
    if ((session.state_ == UploadState::kUnstarted) == session.upload_id_.has_value()) {
      ThrowSnapshotError("upload id does not match state '" + state_name + "'");
    }
    if ((session.state_ == UploadState::kFinalized) != session.archive_id_.has_value()) {
      ThrowSnapshotError("archive id does not match state '" + state_name + "'");
    }
    if (session.state_ == UploadState::kFinalized && !session.all_completed()) {
      ThrowSnapshotError("finalized upload has incomplete chunks");
    }
    // Encrypted parts cannot be re-hashed later; the finalize checksum needs each one.
    for (const auto& chunk : session.chunks_) {
      if (chunk->encrypted() && chunk->completed() && chunk->plain_size() != 0 && !chunk->cached_checksum()) {
        ThrowSnapshotError("completed part " + std::to_string(chunk->part_index()) + " has no checksum");
      }
    }
    session.responses_ = snapshot.at("responses");
    if (!session.responses_.is_object()) {
      ThrowSnapshotError("responses must be an object");
    }
  } catch (const nlohmann::json::exception& ex) {
    ThrowSnapshotError(ex.what());
  }
  return session;
}

}  // namespace gv::orchestrator

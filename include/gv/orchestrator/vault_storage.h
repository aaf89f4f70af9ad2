#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "gv/core/stream_cipher.h"
#include "gv/orchestrator/backend.h"
#include "gv/orchestrator/config.h"
#include "gv/orchestrator/upload_session.h"
#include "gv/storage/chunk_catalog.h"

namespace gv::orchestrator {

// Entry point for archiving files into one vault. Every failed upload leaves a
// resumable snapshot behind before the error reaches the caller.
class VaultStorage {
public:
  using SnapshotCallback = std::function<void(const nlohmann::json&)>;

  VaultStorage(ArchiveBackend& backend, std::string vault, UploadPolicy policy = {},
               storage::ChunkCatalog* catalog = nullptr);

  // `description` defaults to {"path": <file path>}. Returns the archive id.
  std::string UploadFile(const std::filesystem::path& path,
                         std::optional<nlohmann::json> description = std::nullopt,
                         std::shared_ptr<const core::StreamCipher> cipher = nullptr);
  // Continues a session restored from a snapshot. Initialization is skipped
  // once the session has an upload id; a session that is already finalized
  // returns its archive id without touching the backend or the catalog.
  std::string Resume(UploadSession& session);

  void SetSnapshotCallback(SnapshotCallback callback) { on_snapshot_ = std::move(callback); }
  const std::optional<std::filesystem::path>& last_snapshot_path() const noexcept {
    return last_snapshot_path_;
  }

  std::string RequestInventory();
  // Nothing while the job is still listed as in progress.
  std::optional<JobOutput> RetrieveInventory(const std::string& job_id);
  std::vector<std::string> ListRunningJobs();

  const std::string& vault() const noexcept { return vault_; }
  const UploadPolicy& policy() const noexcept { return policy_; }

private:
  std::string Run(UploadSession& session);
  // Reports its own failures on the event bus instead of throwing.
  void DumpSnapshot(const UploadSession& session);
  void WriteSnapshot(const UploadSession& session);
  void RecordInCatalog(const UploadSession& session);

  ArchiveBackend& backend_;
  std::string vault_;
  UploadPolicy policy_;
  storage::ChunkCatalog* catalog_;
  SnapshotCallback on_snapshot_;
  std::optional<std::filesystem::path> last_snapshot_path_;
};

}  // namespace gv::orchestrator

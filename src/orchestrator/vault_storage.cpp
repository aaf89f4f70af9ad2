#include "gv/orchestrator/vault_storage.h"

#include <algorithm>
#include <system_error>

#include "gv/common.h"
#include "gv/error.h"
#include "gv/errors.h"
#include "gv/orchestrator/event_bus.h"
#include "gv/orchestrator/io_util.h"
#include "gv/orchestrator/upload_orchestrator.h"

namespace gv::orchestrator {

namespace {

void PublishStorageEvent(EventSeverity severity, std::string event_id, std::string message,
                         std::vector<EventField> fields) {
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = severity;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields = std::move(fields);
  EventBus::Instance().Publish(event);
}

std::filesystem::path SnapshotFileName(const UploadSession& session) {
  std::filesystem::path name = session.file_path().filename();
  name += ".";
  name += session.upload_id().value_or("pending");
  name += ".snapshot.json";
  return name;
}

}  // namespace

VaultStorage::VaultStorage(ArchiveBackend& backend, std::string vault, UploadPolicy policy,
                           storage::ChunkCatalog* catalog)
    : backend_(backend), vault_(std::move(vault)), policy_(std::move(policy)), catalog_(catalog) {
  ValidateUploadPolicy(policy_);
}

std::string VaultStorage::UploadFile(const std::filesystem::path& path,
                                     std::optional<nlohmann::json> description,
                                     std::shared_ptr<const core::StreamCipher> cipher) {
  if (!description) {
    description = nlohmann::json{{"path", PathToUtf8String(path)}};
  }
  auto session = UploadSession::Create(vault_, path, policy_.part_size, description->dump(), std::move(cipher));
  return Run(session);
}

std::string VaultStorage::Resume(UploadSession& session) {
  if (session.vault() != vault_) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidSnapshot,
                "Session belongs to vault '" + session.vault() + "', not '" + vault_ + "'");
  }
  return Run(session);
}

std::string VaultStorage::Run(UploadSession& session) {
  UploadOrchestrator orchestrator(backend_, session, policy_.worker_threads);
  bool finalized_here = false;
  try {
    if (session.state() == UploadState::kFailed) {
      throw Error(ErrorDomain::State, errors::state::kInvalidTransition,
                  "Upload session failed finalization and cannot be resumed");
    }
    if (!session.upload_id()) {
      orchestrator.Initialize();
    }
    if (!session.archive_id()) {
      orchestrator.UploadLoop(policy_.max_passes);
      orchestrator.Finalize();
      finalized_here = true;
    }
  } catch (...) {
    DumpSnapshot(session);
    throw;
  }
  // A session finalized by an earlier call is already catalogued.
  if (finalized_here) {
    RecordInCatalog(session);
  }
  return *session.archive_id();
}

void VaultStorage::DumpSnapshot(const UploadSession& session) {
  // The upload error is the one the caller needs; snapshot failures go to the bus.
  try {
    WriteSnapshot(session);
  } catch (const std::exception& err) {
    PublishStorageEvent(EventSeverity::kCritical, "upload_snapshot_failed", err.what(),
                        {EventField("vault", vault_)});
  } catch (...) {
    PublishStorageEvent(EventSeverity::kCritical, "upload_snapshot_failed",
                        "Snapshot capture raised a non-standard exception", {EventField("vault", vault_)});
  }
}

void VaultStorage::WriteSnapshot(const UploadSession& session) {
  const auto snapshot = session.ToSnapshot();
  std::vector<EventField> fields{EventField("vault", vault_),
                                 EventField("state", std::string(UploadStateName(session.state())))};
  if (policy_.snapshot_dir) {
    const auto target = *policy_.snapshot_dir / SnapshotFileName(session);
    try {
      std::error_code ec;
      std::filesystem::create_directories(*policy_.snapshot_dir, ec);
      if (ec) {
        throw Error(ErrorDomain::IO, errors::io::kWriteFailed,
                    "Unable to create snapshot directory: " + PathToUtf8String(*policy_.snapshot_dir),
                    ec.value());
      }
      AtomicReplace(target, std::string_view(snapshot.dump(2)));
      last_snapshot_path_ = target;
      fields.emplace_back("snapshot", PathToUtf8String(target), FieldPrivacy::kRedact);
    } catch (const Error& err) {
      // The callback still receives the snapshot when the disk copy fails.
      PublishStorageEvent(EventSeverity::kCritical, "upload_snapshot_write_failed", err.what(),
                          {EventField("vault", vault_)});
    }
  }
  if (on_snapshot_) {
    on_snapshot_(snapshot);
  }
  PublishStorageEvent(EventSeverity::kWarning, "upload_snapshot_dumped",
                      "Upload interrupted; resumable snapshot captured", std::move(fields));
}

void VaultStorage::RecordInCatalog(const UploadSession& session) {
  if (catalog_ == nullptr) {
    return;
  }
  std::error_code ec;
  const auto size = std::filesystem::file_size(session.file_path(), ec);
  if (ec) {
    throw Error(ErrorDomain::IO, errors::io::kOpenFailed,
                std::string(errors::msg::kSourceUnreadable) + ": " + PathToUtf8String(session.file_path()),
                ec.value());
  }
  const auto file_id = catalog_->AddFile(session.file_path(), size);
  for (const auto& chunk : session.chunks()) {
    if (chunk->plain_size() == 0) {
      continue;
    }
    catalog_->AddChunk(file_id, storage::ChunkRecord{static_cast<uint64_t>(chunk->plain_start()),
                                                     chunk->plain_size(),
                                                     chunk->cached_checksum().value_or(""),
                                                     chunk->encrypted(),
                                                     session.upload_id().value_or("")});
  }
}

std::string VaultStorage::RequestInventory() {
  auto job_id = backend_.RequestInventoryJob(vault_);
  PublishStorageEvent(EventSeverity::kInfo, "inventory_requested", "Inventory retrieval job started",
                      {EventField("vault", vault_), EventField("job_id", job_id)});
  return job_id;
}

std::optional<JobOutput> VaultStorage::RetrieveInventory(const std::string& job_id) {
  const auto running = ListRunningJobs();
  if (std::find(running.begin(), running.end(), job_id) != running.end()) {
    return std::nullopt;
  }
  return backend_.FetchJobOutput(vault_, job_id);
}

std::vector<std::string> VaultStorage::ListRunningJobs() {
  return backend_.ListInProgressJobs(vault_);
}

}  // namespace gv::orchestrator

#include "gv/orchestrator/vault_storage.h"
#include "gv/orchestrator/event_bus.h"
#include "gv/common.h"
#include "gv/crypto/random.h"
#include "gv/encoding.h"
#include "gv/error.h"
#include "gv/orchestrator/io_util.h"
#include "gv/storage/chunk_catalog.h"
#include "gv/storage/chunk_layout.h"

#include "support/fake_backend.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using gv::orchestrator::UploadPolicy;
using gv::orchestrator::UploadSession;
using gv::orchestrator::UploadState;
using gv::orchestrator::VaultStorage;
using gv::storage::kMiB;
using gv::testing::FakeBackend;

class TempDir {
public:
  explicit TempDir(const std::string& name) : path_(std::filesystem::temp_directory_path() / name) {
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  const std::filesystem::path& path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

std::filesystem::path WriteRandomFile(const std::filesystem::path& path, size_t size) {
  std::vector<uint8_t> data(size);
  gv::crypto::SystemRandomBytes(data);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  return path;
}

UploadPolicy SmallParts() {
  UploadPolicy policy;
  policy.part_size = kMiB;
  return policy;
}

void TestUploadWithDefaultDescription() {
  TempDir dir("gv_vault_default");
  const auto file = WriteRandomFile(dir.path() / "photo.raw", 2 * kMiB + 3);
  FakeBackend backend;
  gv::storage::ChunkCatalog catalog;
  VaultStorage storage(backend, "photos", SmallParts(), &catalog);

  const auto archive_id = storage.UploadFile(file);
  assert(archive_id == "archive-upload-1");
  assert(backend.last_vault == "photos");

  const auto expected = nlohmann::json{{"path", gv::PathToUtf8String(file)}}.dump();
  assert(backend.last_description == gv::encoding::ToBase64(gv::AsBytes(expected)) &&
         "default description names the file");

  const auto file_id = catalog.FindFile(file);
  assert(file_id && "finished uploads are catalogued");
  assert(catalog.File(*file_id)->size == 2 * kMiB + 3);
  const auto chunks = catalog.ChunksForFile(*file_id);
  assert(chunks.size() == 3 && "one row per uploaded part");
  assert(chunks[0].start_offset == 0 && chunks[2].start_offset == 2 * kMiB && chunks[2].size == 3);
  for (gv::storage::ChunkId id = 1; id <= catalog.chunk_count(); ++id) {
    const auto chunk = catalog.Chunk(id);
    assert(chunk && chunk->file_id == *file_id);
    assert(!chunk->record.checksum.empty());
    assert(!chunk->record.encrypted);
    assert(chunk->record.upload_id == "upload-1");
  }
  catalog.ValidateFile(*file_id);
  assert(!storage.last_snapshot_path() && "no snapshot for a clean upload");
}

void TestEncryptedUploadWithCustomDescription() {
  TempDir dir("gv_vault_encrypted");
  const auto file = WriteRandomFile(dir.path() / "db.dump", 3 * kMiB);
  FakeBackend backend;
  UploadPolicy policy = SmallParts();
  policy.worker_threads = 3;
  VaultStorage storage(backend, "db", policy);
  auto cipher = std::make_shared<const gv::core::StreamCipher>(gv::core::StreamCipher::Generate(true));

  const nlohmann::json description{{"host", "db-1"}, {"kind", "nightly"}};
  storage.UploadFile(file, description, cipher);
  assert(backend.last_description == gv::encoding::ToBase64(gv::AsBytes(description.dump())));
  assert(backend.completed_checksum == gv::crypto::TreeHashHex(backend.Assembled()));
  assert(backend.Assembled().size() > 3 * kMiB && "ciphertext carries per-chunk overhead");
}

void TestFailedUploadDumpsSnapshotAndResumes() {
  TempDir dir("gv_vault_resume");
  const auto file = WriteRandomFile(dir.path() / "video.mkv", 3 * kMiB + 11);
  const auto snapshots = dir.path() / "snapshots";
  FakeBackend backend;
  backend.on_upload_part = [](const FakeBackend::PartCall& call) -> std::optional<std::string> {
    if (call.range.rfind("bytes 0-", 0) == 0) {
      return std::nullopt;
    }
    return std::string("bad");
  };

  UploadPolicy policy = SmallParts();
  policy.max_passes = 2;
  policy.snapshot_dir = snapshots;
  gv::storage::ChunkCatalog catalog;
  VaultStorage storage(backend, "media", policy, &catalog);

  std::optional<nlohmann::json> captured;
  storage.SetSnapshotCallback([&](const nlohmann::json& snapshot) { captured = snapshot; });

  bool threw = false;
  try {
    storage.UploadFile(file);
  } catch (const gv::Error& err) {
    threw = err.code == gv::errors::state::kRetriesExhausted;
  }
  assert(threw && "exhausted retries reach the caller");
  assert(captured && "snapshot handed to the callback");
  assert(storage.last_snapshot_path());
  assert(storage.last_snapshot_path()->parent_path() == snapshots);
  assert(storage.last_snapshot_path()->filename() == "video.mkv.upload-1.snapshot.json");

  const auto bytes = gv::orchestrator::ReadWholeFile(*storage.last_snapshot_path());
  const auto on_disk = nlohmann::json::parse(bytes.begin(), bytes.end());
  assert(on_disk == *captured);
  assert(on_disk.at("state") == "uploading");

  auto session = UploadSession::FromSnapshot(on_disk);
  assert(session.completed_count() == 1);

  backend.on_upload_part = nullptr;
  backend.part_calls.clear();
  const auto archive_id = storage.Resume(session);
  assert(archive_id == "archive-upload-1");
  assert(backend.initiate_calls == 1 && "resume reuses the upload id");
  assert(backend.part_calls.size() == session.chunks().size() - 1);
  assert(session.state() == UploadState::kFinalized);
  assert(catalog.file_count() == 1 && catalog.chunk_count() == 4);

  // Resuming a finished session does not talk to the backend or catalog again.
  const auto complete_calls = backend.complete_calls;
  assert(storage.Resume(session) == archive_id);
  assert(backend.complete_calls == complete_calls);
  assert(catalog.file_count() == 1 && "no duplicate file row");
  assert(catalog.chunk_count() == 4 && "no duplicate chunk rows");
}

struct TransportAbort {};

void TestSnapshotSurvivesForeignAndCallbackErrors() {
  gv::orchestrator::ResetEventBusForTesting();
  size_t snapshot_failures = 0;
  gv::orchestrator::EventBus::Instance().Subscribe([&](const gv::orchestrator::Event& event) {
    if (event.event_id == "upload_snapshot_failed") {
      ++snapshot_failures;
    }
  });

  TempDir dir("gv_vault_foreign");
  const auto file = WriteRandomFile(dir.path() / "log.bin", 10);
  FakeBackend backend;
  backend.on_upload_part = [](const FakeBackend::PartCall&) -> std::optional<std::string> {
    throw TransportAbort{};
  };
  VaultStorage storage(backend, "logs", SmallParts());
  bool captured = false;
  storage.SetSnapshotCallback([&](const nlohmann::json&) { captured = true; });

  bool threw = false;
  try {
    storage.UploadFile(file);
  } catch (const TransportAbort&) {
    threw = true;
  }
  assert(threw && "non-standard exceptions reach the caller unchanged");
  assert(captured && "and still leave a snapshot behind");

  backend.on_upload_part = [](const FakeBackend::PartCall&) -> std::optional<std::string> {
    return std::string("bad");
  };
  storage.SetSnapshotCallback([](const nlohmann::json&) { throw std::runtime_error("callback broke"); });
  threw = false;
  try {
    storage.UploadFile(file);
  } catch (const gv::Error& err) {
    threw = err.code == gv::errors::state::kRetriesExhausted;
  }
  assert(threw && "a throwing callback does not replace the upload error");
  assert(snapshot_failures == 1);
  gv::orchestrator::ResetEventBusForTesting();
}

void TestFailedSessionCannotResume() {
  TempDir dir("gv_vault_failed");
  const auto file = WriteRandomFile(dir.path() / "notes.txt", 100);
  FakeBackend backend;
  backend.complete_checksum_override = std::string(64, 'f');
  VaultStorage storage(backend, "notes", SmallParts());

  std::optional<nlohmann::json> captured;
  storage.SetSnapshotCallback([&](const nlohmann::json& snapshot) { captured = snapshot; });
  bool threw = false;
  try {
    storage.UploadFile(file);
  } catch (const gv::Error& err) {
    threw = err.code == gv::errors::state::kFinalizeChecksumMismatch;
  }
  assert(threw);
  assert(captured && captured->at("state") == "failed");
  assert(!storage.last_snapshot_path() && "no snapshot directory configured");

  auto session = UploadSession::FromSnapshot(*captured);
  threw = false;
  try {
    storage.Resume(session);
  } catch (const gv::Error& err) {
    threw = err.code == gv::errors::state::kInvalidTransition;
  }
  assert(threw && "failed sessions are terminal");

  VaultStorage other(backend, "elsewhere", SmallParts());
  threw = false;
  try {
    other.Resume(session);
  } catch (const gv::Error& err) {
    threw = err.code == gv::errors::config::kInvalidSnapshot;
  }
  assert(threw && "sessions stay bound to their vault");
}

void TestInventoryRetrieval() {
  FakeBackend backend;
  VaultStorage storage(backend, "photos");
  const auto job_id = storage.RequestInventory();
  assert(job_id == "job-1");
  assert(storage.ListRunningJobs() == std::vector<std::string>{job_id});
  assert(!storage.RetrieveInventory(job_id) && "running jobs have no output");

  backend.running_jobs.erase(job_id);
  const auto output = storage.RetrieveInventory(job_id);
  assert(output && output->status == "200");
  const auto body = nlohmann::json::parse(output->body.begin(), output->body.end());
  assert(body.at("VaultARN") == job_id);
}

void TestInvalidPolicyRejected() {
  FakeBackend backend;
  UploadPolicy policy;
  policy.part_size = 3 * kMiB;
  bool threw = false;
  try {
    VaultStorage storage(backend, "v", policy);
    (void)storage;
  } catch (const gv::Error& err) {
    threw = err.code == gv::errors::config::kInvalidPartSize;
  }
  assert(threw && "part size must be a power-of-two multiple of 1 MiB");
}

void TestSnapshotEventIsPublished() {
  gv::orchestrator::ResetEventBusForTesting();
  std::vector<gv::orchestrator::Event> seen;
  gv::orchestrator::EventBus::Instance().Subscribe(
      [&](const gv::orchestrator::Event& event) { seen.push_back(event); });

  TempDir dir("gv_vault_events");
  const auto file = WriteRandomFile(dir.path() / "a.bin", 10);
  FakeBackend backend;
  backend.refuse_initiate = true;
  UploadPolicy policy = SmallParts();
  policy.snapshot_dir = dir.path() / "snaps";
  VaultStorage storage(backend, "v", policy);
  bool threw = false;
  try {
    storage.UploadFile(file);
  } catch (const gv::Error& err) {
    threw = err.code == gv::errors::state::kInitializationFailed;
  }
  assert(threw);
  assert(storage.last_snapshot_path()->filename() == "a.bin.pending.snapshot.json");

  bool dumped = false;
  for (const auto& event : seen) {
    if (event.event_id != "upload_snapshot_dumped") {
      continue;
    }
    dumped = true;
    assert(event.severity == gv::orchestrator::EventSeverity::kWarning);
    for (const auto& field : event.fields) {
      if (field.key == "snapshot") {
        assert(field.value == gv::orchestrator::kRedactedValue);
      }
    }
  }
  assert(dumped);
  gv::orchestrator::ResetEventBusForTesting();
}

}  // namespace

int main() {
  TestUploadWithDefaultDescription();
  TestEncryptedUploadWithCustomDescription();
  TestFailedUploadDumpsSnapshotAndResumes();
  TestSnapshotSurvivesForeignAndCallbackErrors();
  TestFailedSessionCannotResume();
  TestInventoryRetrieval();
  TestInvalidPolicyRejected();
  TestSnapshotEventIsPublished();
  std::cout << "vault storage tests ok\n";
  return 0;
}

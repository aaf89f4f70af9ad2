#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

#include "gv/storage/chunk_layout.h"

namespace gv::orchestrator {

inline constexpr const char* kEnvPartSize = "GV_PART_SIZE";
inline constexpr const char* kEnvUploadPasses = "GV_UPLOAD_PASSES";
inline constexpr const char* kEnvUploadWorkers = "GV_UPLOAD_WORKERS";
inline constexpr const char* kEnvSnapshotDir = "GV_SNAPSHOT_DIR";
inline constexpr const char* kEnvEventLog = "GV_EVENT_LOG";

inline constexpr uint32_t kMaxWorkerThreads = 64;

struct UploadPolicy {
  uint64_t part_size{storage::kDefaultPartSize};
  uint32_t max_passes{3};
  uint32_t worker_threads{1};
  // Where failed uploads leave their resumable snapshot. Unset disables dumps.
  std::optional<std::filesystem::path> snapshot_dir;
};

// Throws Config errors for an invalid part size, zero passes or a worker
// count outside [1, kMaxWorkerThreads].
void ValidateUploadPolicy(const UploadPolicy& policy);

// Overlays GV_PART_SIZE, GV_UPLOAD_PASSES, GV_UPLOAD_WORKERS and
// GV_SNAPSHOT_DIR onto `defaults`, then validates the result.
UploadPolicy LoadUploadPolicyFromEnvironment(UploadPolicy defaults = {});

std::optional<std::filesystem::path> EventLogPathFromEnvironment();
// Points the event bus JSON sink at GV_EVENT_LOG when set. Returns whether a
// sink was configured.
bool ConfigureEventLogFromEnvironment();

}  // namespace gv::orchestrator

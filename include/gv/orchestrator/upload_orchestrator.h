#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include "gv/orchestrator/backend.h"
#include "gv/orchestrator/upload_session.h"

namespace gv::orchestrator {

struct PassReport {
  size_t attempted{0};
  size_t acknowledged{0};
  size_t mismatched{0};
  size_t failed{0}; // retryable backend errors
};

// Drives one UploadSession through
// Unstarted -> Initialized -> Uploading -> Finalized, or Failed when the
// backend rejects the final checksum. Holds references only; the backend and
// the session must outlive it.
class UploadOrchestrator {
public:
  UploadOrchestrator(ArchiveBackend& backend, UploadSession& session, uint32_t worker_threads = 1);

  // Opens the multipart upload. Throws State kInitializationFailed when the
  // backend returns no upload id.
  void Initialize();

  // Sends every incomplete chunk once. Checksum mismatches and retryable
  // backend errors leave the chunk incomplete; fatal errors propagate.
  PassReport UploadOnce();

  // Repeats UploadOnce until all chunks are acknowledged. Throws State
  // kRetriesExhausted after `max_passes` passes with work left; the session
  // stays resumable.
  uint32_t UploadLoop(uint32_t max_passes = 3);

  // Commits the upload and returns the archive id. The checksum sent is the
  // tree hash of the transferred bytes: the source file for a plain session,
  // the ciphertext parts for an encrypted one.
  std::string Finalize();

  // Local whole-upload tree hash as the backend computes it over the bytes it
  // received.
  std::string ComputeTotalChecksum() const;
  uint64_t TotalTransferSize() const;

  UploadSession& session() noexcept { return session_; }

private:
  void UploadChunk(storage::EncryptedChunk& chunk, PassReport& report);
  void RecordResponse(nlohmann::json entry);

  ArchiveBackend& backend_;
  UploadSession& session_;
  uint32_t worker_threads_;
  std::mutex report_mutex_;
};

}  // namespace gv::orchestrator

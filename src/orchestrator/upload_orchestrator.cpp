#include "gv/orchestrator/upload_orchestrator.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>
#include <vector>

#include "gv/common.h"
#include "gv/crypto/tree_hash.h"
#include "gv/encoding.h"
#include "gv/error.h"
#include "gv/errors.h"
#include "gv/orchestrator/event_bus.h"

namespace gv::orchestrator {

namespace {

void PublishUploadEvent(EventSeverity severity, std::string event_id, std::string message,
                        const UploadSession& session, std::vector<EventField> extra = {}) {
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = severity;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields.emplace_back("vault", session.vault());
  event.fields.emplace_back("path", PathToUtf8String(session.file_path()), FieldPrivacy::kRedact);
  if (session.upload_id()) {
    event.fields.emplace_back("upload_id", *session.upload_id());
  }
  for (auto& field : extra) {
    event.fields.push_back(std::move(field));
  }
  EventBus::Instance().Publish(event);
}

EventField NumericField(std::string key, uint64_t value) {
  return EventField(std::move(key), std::to_string(value), FieldPrivacy::kPublic, true);
}

[[noreturn]] void ThrowInvalidTransition(const UploadSession& session, std::string_view operation) {
  throw Error(ErrorDomain::State, errors::state::kInvalidTransition,
              std::string(operation) + " not allowed in state " +
                  std::string(UploadStateName(session.state())));
}

}  // namespace

UploadOrchestrator::UploadOrchestrator(ArchiveBackend& backend, UploadSession& session,
                                       uint32_t worker_threads)
    : backend_(backend), session_(session), worker_threads_(std::max<uint32_t>(worker_threads, 1)) {}

void UploadOrchestrator::Initialize() {
  if (session_.state_ != UploadState::kUnstarted) {
    ThrowInvalidTransition(session_, "initialize");
  }
  const auto description = encoding::ToBase64(AsBytes(session_.description_));
  auto upload_id = backend_.InitiateMultipart(session_.vault_, session_.part_size_, description);
  session_.responses_["initialize"] = nlohmann::json{
      {"part_size", session_.part_size_},
      {"upload_id", upload_id ? nlohmann::json(*upload_id) : nlohmann::json(nullptr)},
  };
  if (!upload_id || upload_id->empty()) {
    PublishUploadEvent(EventSeverity::kError, "upload_initialize_failed",
                       "Backend did not open a multipart upload", session_);
    throw Error(ErrorDomain::State, errors::state::kInitializationFailed,
                std::string(errors::msg::kInitializationNoId));
  }
  session_.upload_id_ = std::move(upload_id);
  session_.state_ = UploadState::kInitialized;
  PublishUploadEvent(EventSeverity::kInfo, "upload_initialized", "Multipart upload created", session_,
                     {NumericField("part_size", session_.part_size_),
                      NumericField("parts", session_.chunks_.size())});
}

void UploadOrchestrator::RecordResponse(nlohmann::json entry) {
  std::lock_guard<std::mutex> guard(report_mutex_);
  auto& log = session_.responses_["upload"];
  if (!log.is_array()) {
    log = nlohmann::json::array();
  }
  log.push_back(std::move(entry));
}

void UploadOrchestrator::UploadChunk(storage::EncryptedChunk& chunk, PassReport& report) {
  const auto range = chunk.ByteRange();
  const auto index = chunk.part_index();
  std::string_view outcome;
  try {
    // Data first: rebuilding an encrypted buffer invalidates the old checksum.
    const auto data = chunk.Data();
    const auto checksum = chunk.Checksum();
    const auto ack = backend_.UploadPart(session_.vault_, *session_.upload_id_, range, *data, checksum);
    RecordResponse(nlohmann::json{
        {"part_index", index},
        {"range", range},
        {"checksum", ack.checksum ? nlohmann::json(*ack.checksum) : nlohmann::json(nullptr)},
    });
    std::lock_guard<std::mutex> guard(report_mutex_);
    if (ack.checksum && *ack.checksum == checksum) {
      chunk.MarkCompleted();
      ++report.acknowledged;
      outcome = "acknowledged";
    } else {
      ++report.mismatched;
      outcome = "mismatched";
    }
  } catch (const Error& err) {
    if (!IsRetryableBackendError(err)) {
      throw;
    }
    RecordResponse(nlohmann::json{{"part_index", index}, {"range", range}, {"error", err.what()}});
    std::lock_guard<std::mutex> guard(report_mutex_);
    ++report.failed;
    outcome = "failed";
  }

  const std::vector<EventField> fields{NumericField("part_index", index), EventField("range", range)};
  if (outcome == "acknowledged") {
    PublishUploadEvent(EventSeverity::kDebug, "upload_part_acknowledged", "Part acknowledged", session_,
                       fields);
  } else if (outcome == "mismatched") {
    PublishUploadEvent(EventSeverity::kWarning, "upload_part_checksum_mismatch",
                       "Backend checksum differs from local part checksum", session_, fields);
  } else {
    PublishUploadEvent(EventSeverity::kWarning, "upload_part_failed", "Part transfer failed; will retry",
                       session_, fields);
  }
}

PassReport UploadOrchestrator::UploadOnce() {
  if (!session_.upload_id_ ||
      (session_.state_ != UploadState::kInitialized && session_.state_ != UploadState::kUploading)) {
    ThrowInvalidTransition(session_, "upload");
  }
  session_.state_ = UploadState::kUploading;

  std::vector<storage::EncryptedChunk*> pending;
  for (auto& chunk : session_.chunks_) {
    if (!chunk->completed()) {
      pending.push_back(chunk.get());
    }
  }
  PassReport report;
  report.attempted = pending.size();

  const size_t workers = std::min<size_t>(worker_threads_, pending.size());
  if (workers <= 1) {
    for (auto* chunk : pending) {
      UploadChunk(*chunk, report);
    }
  } else {
    std::atomic<size_t> next{0};
    std::exception_ptr failure;
    std::mutex failure_mutex;
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
      pool.emplace_back([&] {
        for (;;) {
          {
            std::lock_guard<std::mutex> guard(failure_mutex);
            if (failure) {
              return;
            }
          }
          const size_t i = next.fetch_add(1);
          if (i >= pending.size()) {
            return;
          }
          try {
            UploadChunk(*pending[i], report);
          } catch (const std::exception&) {
            std::lock_guard<std::mutex> guard(failure_mutex);
            if (!failure) {
              failure = std::current_exception();
            }
          }
        }
      });
    }
    for (auto& thread : pool) {
      thread.join();
    }
    if (failure) {
      std::rethrow_exception(failure);
    }
  }

  PublishUploadEvent(EventSeverity::kInfo, "upload_pass_completed", "Upload pass completed", session_,
                     {NumericField("attempted", report.attempted),
                      NumericField("acknowledged", report.acknowledged),
                      NumericField("mismatched", report.mismatched),
                      NumericField("failed", report.failed)});
  return report;
}

uint32_t UploadOrchestrator::UploadLoop(uint32_t max_passes) {
  uint32_t passes = 0;
  while (!session_.all_completed()) {
    if (passes >= max_passes) {
      PublishUploadEvent(EventSeverity::kError, "upload_retries_exhausted", std::string(errors::msg::kRetriesExhausted),
                         session_,
                         {NumericField("passes", passes),
                          NumericField("incomplete", session_.chunks_.size() - session_.completed_count())});
      throw Error(ErrorDomain::State, errors::state::kRetriesExhausted,
                  std::string(errors::msg::kRetriesExhausted) + " after " + std::to_string(passes) +
                      " passes");
    }
    UploadOnce();
    ++passes;
  }
  return passes;
}

uint64_t UploadOrchestrator::TotalTransferSize() const {
  uint64_t total = 0;
  for (const auto& chunk : session_.chunks_) {
    total += chunk->transfer_size();
  }
  return total;
}

std::string UploadOrchestrator::ComputeTotalChecksum() const {
  if (!session_.encrypted()) {
    return crypto::TreeHashFileHex(session_.file_path_);
  }
  // Parts are aligned to tree-hash subtrees, so their roots combine into the
  // root over the concatenated ciphertext. Re-encrypting would change it.
  std::vector<crypto::TreeDigest> roots;
  roots.reserve(session_.chunks_.size());
  for (const auto& chunk : session_.chunks_) {
    if (chunk->transfer_size() == 0) {
      continue;
    }
    const auto cached = chunk->cached_checksum();
    if (!cached) {
      throw Error(ErrorDomain::State, errors::state::kInvalidTransition,
                  "Encrypted part " + std::to_string(chunk->part_index()) + " has no recorded checksum");
    }
    const auto bytes = encoding::FromHex(*cached);
    crypto::TreeDigest digest{};
    if (bytes.size() != digest.size()) {
      throw Error(ErrorDomain::Validation, errors::validation::kMalformedEncoding,
                  "Part checksum has the wrong length");
    }
    std::copy(bytes.begin(), bytes.end(), digest.begin());
    roots.push_back(digest);
  }
  return encoding::ToHex(crypto::CombineTreeHashes(roots));
}

std::string UploadOrchestrator::Finalize() {
  if (!session_.upload_id_ ||
      (session_.state_ != UploadState::kInitialized && session_.state_ != UploadState::kUploading) ||
      !session_.all_completed()) {
    ThrowInvalidTransition(session_, "finalize");
  }
  const auto checksum = ComputeTotalChecksum();
  const auto total_size = TotalTransferSize();
  const auto ack = backend_.CompleteMultipart(session_.vault_, *session_.upload_id_, total_size, checksum);
  session_.responses_["finalize"] = nlohmann::json{
      {"size", total_size},
      {"checksum", ack.checksum ? nlohmann::json(*ack.checksum) : nlohmann::json(nullptr)},
      {"archive_id", ack.archive_id ? nlohmann::json(*ack.archive_id) : nlohmann::json(nullptr)},
  };
  if (!ack.checksum || *ack.checksum != checksum || !ack.archive_id) {
    session_.state_ = UploadState::kFailed;
    PublishUploadEvent(EventSeverity::kError, "upload_finalize_checksum_mismatch",
                       std::string(errors::msg::kFinalizeChecksumMismatch), session_,
                       {EventField("local_checksum", checksum)});
    throw Error(ErrorDomain::State, errors::state::kFinalizeChecksumMismatch,
                std::string(errors::msg::kFinalizeChecksumMismatch));
  }
  session_.archive_id_ = ack.archive_id;
  session_.state_ = UploadState::kFinalized;
  PublishUploadEvent(EventSeverity::kInfo, "upload_finalized", "Multipart upload completed", session_,
                     {EventField("archive_id", *session_.archive_id_), NumericField("size", total_size)});
  return *session_.archive_id_;
}

}  // namespace gv::orchestrator

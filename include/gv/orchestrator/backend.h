#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "gv/error.h"

namespace gv::orchestrator {

struct UploadPartAck {
  std::optional<std::string> checksum;
};

struct CompleteMultipartAck {
  std::optional<std::string> archive_id;
  std::optional<std::string> checksum;
};

struct JobOutput {
  std::string content_type;
  std::string status;
  std::vector<uint8_t> body;
};

// Cold-storage multipart API. Implementations report failures as
// Error{ErrorDomain::Backend}; a retryability other than kFatal marks the
// failure as worth another pass.
class ArchiveBackend {
public:
  virtual ~ArchiveBackend() = default;

  // Returns the upload id, or nothing when the backend refused to open one.
  // `description` is already base64 encoded.
  virtual std::optional<std::string> InitiateMultipart(const std::string& vault, uint64_t part_size,
                                                       const std::string& description) = 0;
  virtual UploadPartAck UploadPart(const std::string& vault, const std::string& upload_id,
                                   const std::string& byte_range, std::span<const uint8_t> data,
                                   const std::string& checksum) = 0;
  virtual CompleteMultipartAck CompleteMultipart(const std::string& vault, const std::string& upload_id,
                                                 uint64_t total_size, const std::string& checksum) = 0;

  virtual std::vector<std::string> ListInProgressJobs(const std::string& vault) = 0;
  virtual std::string RequestInventoryJob(const std::string& vault) = 0;
  // Nothing while the job output is not available yet.
  virtual std::optional<JobOutput> FetchJobOutput(const std::string& vault, const std::string& job_id) = 0;
};

inline Error BackendError(std::string message, Retryability retry = Retryability::kTransient,
                          int code = errors::backend::kRequestFailed) {
  return Error(ErrorDomain::Backend, code, std::move(message), std::nullopt, retry);
}

inline bool IsRetryableBackendError(const Error& err) noexcept {
  return err.domain == ErrorDomain::Backend && err.retryability != Retryability::kFatal;
}

}  // namespace gv::orchestrator

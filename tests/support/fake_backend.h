#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

#include "gv/crypto/tree_hash.h"
#include "gv/encoding.h"
#include "gv/orchestrator/backend.h"

namespace gv::testing {

// In-memory multipart backend. Stores received parts by byte offset, echoes
// the tree hash of the bytes it actually received, and lets tests inject
// failures per call.
class FakeBackend : public orchestrator::ArchiveBackend {
public:
  struct PartCall {
    std::string range;
    uint64_t size{0};
    std::string checksum;
  };

  // Return a value to override the acknowledged checksum for this call, or
  // throw to simulate a transfer failure.
  std::function<std::optional<std::string>(const PartCall&)> on_upload_part;
  bool refuse_initiate{false};
  std::optional<std::string> complete_checksum_override;

  std::optional<std::string> InitiateMultipart(const std::string& vault, uint64_t part_size,
                                               const std::string& description) override {
    std::lock_guard<std::mutex> guard(mutex_);
    ++initiate_calls;
    last_vault = vault;
    last_part_size = part_size;
    last_description = description;
    if (refuse_initiate) {
      return std::nullopt;
    }
    return "upload-" + std::to_string(initiate_calls);
  }

  orchestrator::UploadPartAck UploadPart(const std::string& vault, const std::string& upload_id,
                                         const std::string& byte_range, std::span<const uint8_t> data,
                                         const std::string& checksum) override {
    (void)vault;
    (void)upload_id;
    PartCall call{byte_range, data.size(), checksum};
    {
      std::lock_guard<std::mutex> guard(mutex_);
      part_calls.push_back(call);
    }
    std::optional<std::string> override_ack;
    if (on_upload_part) {
      override_ack = on_upload_part(call);
    }
    const auto received = crypto::TreeHashHex(data);
    std::lock_guard<std::mutex> guard(mutex_);
    parts[ParseStart(byte_range)] = std::vector<uint8_t>(data.begin(), data.end());
    return orchestrator::UploadPartAck{override_ack ? override_ack : std::optional<std::string>(received)};
  }

  orchestrator::CompleteMultipartAck CompleteMultipart(const std::string& vault, const std::string& upload_id,
                                                       uint64_t total_size, const std::string& checksum) override {
    (void)vault;
    std::lock_guard<std::mutex> guard(mutex_);
    ++complete_calls;
    completed_size = total_size;
    completed_checksum = checksum;
    crypto::TreeHasher hasher;
    for (const auto& [offset, bytes] : parts) {
      (void)offset;
      hasher.Update(bytes);
    }
    const auto received = hasher.FinishHex();
    return orchestrator::CompleteMultipartAck{"archive-" + upload_id,
                                              complete_checksum_override.value_or(received)};
  }

  std::vector<std::string> ListInProgressJobs(const std::string& vault) override {
    (void)vault;
    std::lock_guard<std::mutex> guard(mutex_);
    return std::vector<std::string>(running_jobs.begin(), running_jobs.end());
  }

  std::string RequestInventoryJob(const std::string& vault) override {
    (void)vault;
    std::lock_guard<std::mutex> guard(mutex_);
    const auto job_id = "job-" + std::to_string(++job_counter_);
    running_jobs.insert(job_id);
    return job_id;
  }

  std::optional<orchestrator::JobOutput> FetchJobOutput(const std::string& vault,
                                                        const std::string& job_id) override {
    (void)vault;
    std::lock_guard<std::mutex> guard(mutex_);
    ++fetch_calls;
    if (running_jobs.count(job_id) != 0) {
      return std::nullopt;
    }
    const std::string body = "{\"VaultARN\":\"" + job_id + "\",\"ArchiveList\":[]}";
    return orchestrator::JobOutput{"application/json", "200",
                                   std::vector<uint8_t>(body.begin(), body.end())};
  }

  // All received bytes in offset order.
  std::vector<uint8_t> Assembled() const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<uint8_t> out;
    for (const auto& [offset, bytes] : parts) {
      (void)offset;
      out.insert(out.end(), bytes.begin(), bytes.end());
    }
    return out;
  }

  size_t initiate_calls{0};
  size_t complete_calls{0};
  size_t fetch_calls{0};
  uint64_t last_part_size{0};
  std::string last_vault;
  std::string last_description;
  uint64_t completed_size{0};
  std::string completed_checksum;
  std::vector<PartCall> part_calls;
  std::map<int64_t, std::vector<uint8_t>> parts;
  std::set<std::string> running_jobs;

private:
  static int64_t ParseStart(const std::string& range) {
    // "bytes S-E/*"
    const auto begin = range.find(' ') + 1;
    const auto dash = range.find('-', begin);
    return std::stoll(range.substr(begin, dash - begin));
  }

  mutable std::mutex mutex_;
  uint64_t job_counter_{0};
};

}  // namespace gv::testing

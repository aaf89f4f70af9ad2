#include "gv/orchestrator/config.h"

#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>

#include "gv/error.h"
#include "gv/orchestrator/event_bus.h"

namespace gv::orchestrator {

namespace {

std::optional<std::string_view> ReadEnv(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string_view(value);
}

[[noreturn]] void ThrowInvalidEnvironment(const char* name, std::string_view value, std::string_view why) {
  throw Error(ErrorDomain::Config, errors::config::kInvalidEnvironment,
              std::string(name) + "='" + std::string(value) + "': " + std::string(why));
}

template <typename T>
T ParseEnvNumber(const char* name, std::string_view text) {
  T parsed{};
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec == std::errc::result_out_of_range) {
    ThrowInvalidEnvironment(name, text, "value out of range");
  }
  if (ec != std::errc() || ptr != last) {
    ThrowInvalidEnvironment(name, text, "expected a decimal integer");
  }
  return parsed;
}

}  // namespace

void ValidateUploadPolicy(const UploadPolicy& policy) {
  storage::ValidatePartSize(policy.part_size);
  if (policy.max_passes == 0) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidEnvironment,
                "Upload policy needs at least one pass");
  }
  if (policy.worker_threads == 0 || policy.worker_threads > kMaxWorkerThreads) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidEnvironment,
                "Upload worker count must be between 1 and " + std::to_string(kMaxWorkerThreads));
  }
}

UploadPolicy LoadUploadPolicyFromEnvironment(UploadPolicy defaults) {
  UploadPolicy policy = std::move(defaults);
  if (auto value = ReadEnv(kEnvPartSize)) {
    policy.part_size = ParseEnvNumber<uint64_t>(kEnvPartSize, *value);
    if (!storage::IsValidPartSize(policy.part_size)) {
      ThrowInvalidEnvironment(kEnvPartSize, *value, "part size must be 1 MiB times a power of two");
    }
  }
  if (auto value = ReadEnv(kEnvUploadPasses)) {
    policy.max_passes = ParseEnvNumber<uint32_t>(kEnvUploadPasses, *value);
    if (policy.max_passes == 0) {
      ThrowInvalidEnvironment(kEnvUploadPasses, *value, "must be positive");
    }
  }
  if (auto value = ReadEnv(kEnvUploadWorkers)) {
    policy.worker_threads = ParseEnvNumber<uint32_t>(kEnvUploadWorkers, *value);
    if (policy.worker_threads == 0 || policy.worker_threads > kMaxWorkerThreads) {
      ThrowInvalidEnvironment(kEnvUploadWorkers, *value, "worker count out of range");
    }
  }
  if (auto value = ReadEnv(kEnvSnapshotDir)) {
    policy.snapshot_dir = std::filesystem::u8path(*value);
  }
  ValidateUploadPolicy(policy);
  return policy;
}

std::optional<std::filesystem::path> EventLogPathFromEnvironment() {
  if (auto value = ReadEnv(kEnvEventLog)) {
    return std::filesystem::u8path(*value);
  }
  return std::nullopt;
}

bool ConfigureEventLogFromEnvironment() {
  auto path = EventLogPathFromEnvironment();
  if (!path) {
    return false;
  }
  EventBus::Instance().ConfigureJsonLog(*path);
  return true;
}

}  // namespace gv::orchestrator

#include "gv/orchestrator/config.h"
#include "gv/orchestrator/event_bus.h"
#include "gv/error.h"
#include "gv/orchestrator/io_util.h"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

namespace {

using namespace gv::orchestrator;

class EnvGuard {
public:
  EnvGuard(const char* name, const char* value) : name_(name) {
    ::setenv(name, value, 1);
  }
  ~EnvGuard() { ::unsetenv(name_); }
  EnvGuard(const EnvGuard&) = delete;
  EnvGuard& operator=(const EnvGuard&) = delete;

private:
  const char* name_;
};

template <typename Fn>
bool ThrowsConfig(Fn&& fn, int code) {
  try {
    fn();
  } catch (const gv::Error& err) {
    return err.domain == gv::ErrorDomain::Config && err.code == code;
  }
  return false;
}

void TestDefaults() {
  for (const char* name : {kEnvPartSize, kEnvUploadPasses, kEnvUploadWorkers, kEnvSnapshotDir}) {
    ::unsetenv(name);
  }
  const auto policy = LoadUploadPolicyFromEnvironment();
  assert(policy.part_size == gv::storage::kDefaultPartSize);
  assert(policy.max_passes == 3);
  assert(policy.worker_threads == 1);
  assert(!policy.snapshot_dir);
}

void TestOverrides() {
  EnvGuard part(kEnvPartSize, "8388608");
  EnvGuard passes(kEnvUploadPasses, "5");
  EnvGuard workers(kEnvUploadWorkers, "4");
  EnvGuard dir(kEnvSnapshotDir, "/var/lib/gv/snapshots");
  const auto policy = LoadUploadPolicyFromEnvironment();
  assert(policy.part_size == 8 * gv::storage::kMiB);
  assert(policy.max_passes == 5);
  assert(policy.worker_threads == 4);
  assert(policy.snapshot_dir == std::filesystem::path("/var/lib/gv/snapshots"));
}

void TestEmptyValuesKeepDefaults() {
  EnvGuard passes(kEnvUploadPasses, "");
  UploadPolicy defaults;
  defaults.max_passes = 7;
  assert(LoadUploadPolicyFromEnvironment(defaults).max_passes == 7);
}

void TestStrictParsing() {
  {
    EnvGuard part(kEnvPartSize, "3145728");
    assert(ThrowsConfig([] { (void)LoadUploadPolicyFromEnvironment(); }, gv::errors::config::kInvalidEnvironment) &&
           "3 MiB is not a power-of-two part size");
  }
  {
    EnvGuard part(kEnvPartSize, "1MiB");
    assert(ThrowsConfig([] { (void)LoadUploadPolicyFromEnvironment(); }, gv::errors::config::kInvalidEnvironment) &&
           "trailing text rejected");
  }
  {
    EnvGuard passes(kEnvUploadPasses, "0");
    assert(ThrowsConfig([] { (void)LoadUploadPolicyFromEnvironment(); }, gv::errors::config::kInvalidEnvironment));
  }
  {
    EnvGuard passes(kEnvUploadPasses, "99999999999");
    bool threw = false;
    try {
      (void)LoadUploadPolicyFromEnvironment();
    } catch (const gv::Error& err) {
      threw = std::string(err.what()).find("GV_UPLOAD_PASSES='99999999999'") != std::string::npos;
    }
    assert(threw && "message names the variable and its value");
  }
  {
    EnvGuard workers(kEnvUploadWorkers, "65");
    assert(ThrowsConfig([] { (void)LoadUploadPolicyFromEnvironment(); }, gv::errors::config::kInvalidEnvironment));
  }
  {
    EnvGuard workers(kEnvUploadWorkers, "-2");
    assert(ThrowsConfig([] { (void)LoadUploadPolicyFromEnvironment(); }, gv::errors::config::kInvalidEnvironment));
  }
}

void TestValidatePolicy() {
  UploadPolicy policy;
  ValidateUploadPolicy(policy);
  policy.part_size = 4096 * gv::storage::kMiB;
  ValidateUploadPolicy(policy);
  policy.part_size = 512 * 1024;
  assert(ThrowsConfig([&] { ValidateUploadPolicy(policy); }, gv::errors::config::kInvalidPartSize));
  policy.part_size = gv::storage::kMiB;
  policy.worker_threads = 0;
  assert(ThrowsConfig([&] { ValidateUploadPolicy(policy); }, gv::errors::config::kInvalidEnvironment));
}

void TestEventLogFromEnvironment() {
  ResetEventBusForTesting();
  ::unsetenv(kEnvEventLog);
  assert(!ConfigureEventLogFromEnvironment());

  const auto log_path = std::filesystem::temp_directory_path() / "gv_config_events.jsonl";
  std::filesystem::remove(log_path);
  {
    EnvGuard log(kEnvEventLog, log_path.c_str());
    assert(EventLogPathFromEnvironment() == log_path);
    assert(ConfigureEventLogFromEnvironment());
  }

  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kInfo;
  event.event_id = "upload_part_acknowledged";
  event.message = "part stored";
  event.fields.emplace_back("part_index", "3", FieldPrivacy::kPublic, true);
  event.fields.emplace_back("path", "/home/user/secret.tar", FieldPrivacy::kRedact);
  EventBus::Instance().Publish(event);
  ResetEventBusForTesting();

  const auto bytes = ReadWholeFile(log_path);
  std::istringstream lines(std::string(bytes.begin(), bytes.end()));
  std::string line;
  const bool have_line = static_cast<bool>(std::getline(lines, line));
  assert(have_line);
  const auto json = nlohmann::json::parse(line);
  assert(json.at("event_id") == "upload_part_acknowledged");
  assert(json.at("severity") == "info");
  assert(json.at("part_index") == 3 && "numeric fields are numbers");
  assert(json.at("path") == std::string(kRedactedValue));
  assert(json.at("timestamp").get<std::string>().back() == 'Z');
  const bool extra_line = static_cast<bool>(std::getline(lines, line));
  assert(!extra_line && "one line per event");
  std::filesystem::remove(log_path);
}

}  // namespace

int main() {
  TestDefaults();
  TestOverrides();
  TestEmptyValuesKeepDefaults();
  TestStrictParsing();
  TestValidatePolicy();
  TestEventLogFromEnvironment();
  std::cout << "config tests ok\n";
  return 0;
}

#include "gv/orchestrator/event_bus.h"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "gv/common.h"

namespace gv::orchestrator {

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

Event RedactEvent(const Event& event) {
  Event sanitized = event;
  for (auto& field : sanitized.fields) {
    if (field.privacy == FieldPrivacy::kRedact) {
      field.value = std::string(kRedactedValue);
      field.numeric = false;
    }
  }
  return sanitized;
}

nlohmann::json EventToJson(const Event& event, std::string_view timestamp) {
  nlohmann::json line{
      {"timestamp", std::string(timestamp)},
      {"severity", SeverityToString(event.severity)},
      {"category", CategoryToString(event.category)},
      {"event_id", event.event_id},
      {"message", event.message},
  };
  for (const auto& field : event.fields) {
    if (field.numeric) {
      // Numeric fields are written as numbers when they parse cleanly.
      auto parsed = nlohmann::json::parse(field.value, nullptr, false);
      if (!parsed.is_discarded() && parsed.is_number()) {
        line[field.key] = parsed;
        continue;
      }
    }
    line[field.key] = field.value;
  }
  return line;
}

JsonLineLogger::JsonLineLogger(std::filesystem::path path) : log_path_(std::move(path)) {}

std::string JsonLineLogger::FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!stream_.is_open()) {
    stream_.open(log_path_, std::ios::app);
    if (!stream_.is_open()) {
      if (!reported_failure_) {
        std::clog << "{\"event\":\"logger_error\",\"message\":\"failed to open log file\",\"path\":"
                  << nlohmann::json(gv::PathToUtf8String(log_path_)).dump() << "}" << std::endl;
        reported_failure_ = true;
      }
      return;
    }
  }
  stream_ << EventToJson(event, FormatTimestamp(std::chrono::system_clock::now())).dump() << '\n';
  stream_.flush();
}

EventBus& EventBus::Instance() {
  static EventBus instance;
  return instance;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  in_publish = true;
  struct ResetFlag {
    bool& flag;
    ~ResetFlag() { flag = false; }
  } reset{in_publish};

  std::shared_ptr<const std::vector<Subscriber>> targets;
  std::shared_ptr<JsonLineLogger> json_log;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    targets = subscribers_;
    json_log = json_log_;
  }

  const Event sanitized = RedactEvent(event);
  if (sanitized.severity >= EventSeverity::kWarning) {
    std::clog << "[" << SeverityToString(sanitized.severity) << "] " << sanitized.event_id << ": "
              << sanitized.message << std::endl;
  }
  if (json_log) {
    json_log->Log(sanitized);
  }
  if (targets) {
    for (const auto& subscriber : *targets) {
      if (subscriber) {
        subscriber(sanitized);
      }
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto updated = subscribers_ ? std::make_shared<std::vector<Subscriber>>(*subscribers_)
                              : std::make_shared<std::vector<Subscriber>>();
  updated->push_back(std::move(fn));
  subscribers_ = std::move(updated);
}

void EventBus::ConfigureJsonLog(const std::filesystem::path& path) {
  auto logger = std::make_shared<JsonLineLogger>(path);
  std::lock_guard<std::mutex> guard(mutex_);
  json_log_ = std::move(logger);
}

void EventBus::DisableJsonLog() {
  std::lock_guard<std::mutex> guard(mutex_);
  json_log_.reset();
}

void ResetEventBusForTesting() {
  auto& bus = EventBus::Instance();
  std::lock_guard<std::mutex> guard(bus.mutex_);
  bus.subscribers_.reset();
  bus.json_log_.reset();
}

} // namespace gv::orchestrator

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace gv::orchestrator {

  // Structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact };

  inline constexpr std::string_view kRedactedValue{"[redacted]"};

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  const char* SeverityToString(EventSeverity severity);
  const char* CategoryToString(EventCategory category);

  // Copy of the event with every redacted field value replaced.
  Event RedactEvent(const Event& event);
  nlohmann::json EventToJson(const Event& event, std::string_view timestamp);

  // Appends one JSON object per event to a file.
  class JsonLineLogger {
  public:
    explicit JsonLineLogger(std::filesystem::path path);
    void Log(const Event& event);
    const std::filesystem::path& path() const noexcept { return log_path_; }

  private:
    static std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

    std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    bool reported_failure_{false};
  };

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    // Subscribers and the file sink only ever see the redacted event. Warning
    // and higher severities are echoed to std::clog.
    void Publish(const Event& event);
    void Subscribe(Subscriber fn);
    void ConfigureJsonLog(const std::filesystem::path& path);
    void DisableJsonLog();

  private:
    friend void ResetEventBusForTesting();

    std::mutex mutex_;
    std::shared_ptr<const std::vector<Subscriber>> subscribers_;
    std::shared_ptr<JsonLineLogger> json_log_;
  };

  void ResetEventBusForTesting(); // clears subscribers and sinks

} // namespace gv::orchestrator

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zf::orchestrator {

enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

enum class EventCategory { kLifecycle, kIntegrity, kSecurity, kDiagnostics };

// kRedact drops the value entirely; kHash replaces it with HashForTelemetry().
enum class FieldPrivacy { kPublic, kRedact, kHash };

struct EventField {
  std::string key;
  std::string value;
  FieldPrivacy privacy{FieldPrivacy::kPublic};
  bool numeric{false};

  EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic, bool is_numeric = false)
      : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
};

struct Event {
  EventCategory category{EventCategory::kDiagnostics};
  EventSeverity severity{EventSeverity::kInfo};
  std::string event_id;
  std::string message;
  std::vector<EventField> fields;
};

std::string HashForTelemetry(std::string_view input);

const char* SeverityToString(EventSeverity severity);
const char* CategoryToString(EventCategory category);
std::optional<EventSeverity> ParseSeverity(std::string_view text);

std::string FormatEventJson(const Event& event, std::chrono::system_clock::time_point when);

// ZF_EVENT_LOG sink. The first open or write failure is reported on std::clog,
// after which the sink drops everything.
class JsonLineLogger {
public:
  explicit JsonLineLogger(std::filesystem::path path);
  void Log(const Event& event);

private:
  void Disable(std::string_view reason);

  std::mutex mutex_;
  std::filesystem::path path_;
  std::ofstream stream_;
  bool disabled_{false};
};

// Process-wide fan-out of diagnostic events. The console sink honours
// ZF_LOG_LEVEL (default "warning"); the file sink is added when ZF_EVENT_LOG is set.
class EventBus {
public:
  using Subscriber = std::function<void(const Event&)>;

  EventBus();

  static EventBus& Instance();

  void Publish(const Event& event);
  void Subscribe(Subscriber fn);
  void SetConsoleThreshold(EventSeverity severity);

private:
  using SinkList = std::vector<Subscriber>;

  void InstallSinks(std::shared_ptr<const SinkList> sinks);

  std::mutex write_mutex_;
  std::shared_ptr<const SinkList> sinks_;
  std::atomic<EventSeverity> console_threshold_{EventSeverity::kWarning};
};

// Drops the singleton so the next Instance() re-reads the environment.
void ResetEventBusForTesting();

}  // namespace zf::orchestrator

#include "zf/orchestrator/event_bus.h"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>

#include <openssl/evp.h>

#include "zf/common.h"

namespace zf::orchestrator {
namespace {

constexpr size_t kTelemetryHashChars = 16;

struct Singleton {
  std::mutex mutex;
  std::unique_ptr<EventBus> bus;
};

Singleton& GlobalBus() {
  static Singleton singleton;
  return singleton;
}

// Subscribers that publish from inside a callback would recurse without bound.
thread_local bool tls_publishing = false;

void AppendJsonString(std::string& out, std::string_view text) {
  out.push_back('"');
  for (const char raw : text) {
    const auto c = static_cast<unsigned char>(raw);
    if (c == '"' || c == '\\') {
      out.push_back('\\');
      out.push_back(raw);
    } else if (c == '\n') {
      out += "\\n";
    } else if (c == '\r') {
      out += "\\r";
    } else if (c == '\t') {
      out += "\\t";
    } else if (c < 0x20) {
      std::array<char, 8> escaped{};
      std::snprintf(escaped.data(), escaped.size(), "\\u%04x", c);
      out += escaped.data();
    } else {
      out.push_back(raw);
    }
  }
  out.push_back('"');
}

std::string Iso8601Utc(std::chrono::system_clock::time_point when) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  std::array<char, 32> text{};
  const size_t written = std::strftime(text.data(), text.size(), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(text.data(), written);
}

void AppendField(std::string& out, const EventField& field) {
  out.push_back(',');
  AppendJsonString(out, field.key);
  out.push_back(':');
  switch (field.privacy) {
  case FieldPrivacy::kRedact:
    AppendJsonString(out, "[REDACTED]");
    return;
  case FieldPrivacy::kHash:
    AppendJsonString(out, HashForTelemetry(field.value));
    return;
  case FieldPrivacy::kPublic:
    break;
  }
  if (field.numeric) {
    out += field.value;
  } else {
    AppendJsonString(out, field.value);
  }
}

}  // namespace

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return {};
  }
  std::array<uint8_t, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  if (EVP_Digest(input.data(), input.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) != 1) {
    return "[UNHASHED]";
  }
  return zf::ToHex(std::span<const uint8_t>(digest.data(), digest_len)).substr(0, kTelemetryHashChars);
}

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
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kIntegrity:
    return "integrity";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

std::optional<EventSeverity> ParseSeverity(std::string_view text) {
  constexpr std::array kLevels = {EventSeverity::kDebug, EventSeverity::kInfo, EventSeverity::kWarning,
                                  EventSeverity::kError, EventSeverity::kCritical};
  for (const auto level : kLevels) {
    if (text == SeverityToString(level)) {
      return level;
    }
  }
  return std::nullopt;
}

std::string FormatEventJson(const Event& event, std::chrono::system_clock::time_point when) {
  std::string line = "{\"ts\":";
  AppendJsonString(line, Iso8601Utc(when));
  line += ",\"severity\":";
  AppendJsonString(line, SeverityToString(event.severity));
  line += ",\"category\":";
  AppendJsonString(line, CategoryToString(event.category));
  if (!event.event_id.empty()) {
    line += ",\"event_id\":";
    AppendJsonString(line, event.event_id);
  }
  if (!event.message.empty()) {
    line += ",\"message\":";
    AppendJsonString(line, event.message);
  }
  for (const auto& field : event.fields) {
    AppendField(line, field);
  }
  line.push_back('}');
  return line;
}

JsonLineLogger::JsonLineLogger(std::filesystem::path path) : path_(std::move(path)) {}

void JsonLineLogger::Disable(std::string_view reason) {
  disabled_ = true;
  std::string line = "{\"event\":\"logger_error\",\"message\":";
  AppendJsonString(line, reason);
  line.push_back('}');
  std::clog << line << std::endl;
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (disabled_) {
    return;
  }
  if (!stream_.is_open()) {
    stream_.open(path_, std::ios::out | std::ios::app);
    if (!stream_) {
      Disable("failed to open event log");
      return;
    }
  }
  stream_ << FormatEventJson(event, std::chrono::system_clock::now()) << '\n' << std::flush;
  if (!stream_) {
    Disable("event log write failed");
  }
}

EventBus::EventBus() {
  if (const char* level = std::getenv("ZF_LOG_LEVEL")) {
    if (const auto parsed = ParseSeverity(level)) {
      console_threshold_.store(*parsed);
    }
  }

  auto sinks = std::make_shared<SinkList>();
  sinks->emplace_back([this](const Event& event) {
    if (event.severity >= console_threshold_.load(std::memory_order_relaxed)) {
      std::clog << FormatEventJson(event, std::chrono::system_clock::now()) << std::endl;
    }
  });
  const char* log_path = std::getenv("ZF_EVENT_LOG");
  if (log_path != nullptr && *log_path != '\0') {
    sinks->emplace_back([file = std::make_shared<JsonLineLogger>(log_path)](const Event& event) {
      file->Log(event);
    });
  }
  InstallSinks(std::move(sinks));
}

void EventBus::InstallSinks(std::shared_ptr<const SinkList> sinks) {
  std::atomic_store_explicit(&sinks_, std::move(sinks), std::memory_order_release);
}

EventBus& EventBus::Instance() {
  auto& global = GlobalBus();
  std::lock_guard<std::mutex> lock(global.mutex);
  if (!global.bus) {
    global.bus = std::make_unique<EventBus>();
  }
  return *global.bus;
}

void EventBus::Publish(const Event& event) {
  if (tls_publishing) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  struct PublishingScope {
    PublishingScope() { tls_publishing = true; }
    ~PublishingScope() { tls_publishing = false; }
  } scope;
  const auto sinks = std::atomic_load_explicit(&sinks_, std::memory_order_acquire);
  for (const auto& sink : *sinks) {
    sink(event);
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  auto extended = std::make_shared<SinkList>(*std::atomic_load_explicit(&sinks_, std::memory_order_acquire));
  extended->push_back(std::move(fn));
  InstallSinks(std::move(extended));
}

void EventBus::SetConsoleThreshold(EventSeverity severity) {
  console_threshold_.store(severity, std::memory_order_relaxed);
}

void ResetEventBusForTesting() {
  auto& global = GlobalBus();
  std::lock_guard<std::mutex> lock(global.mutex);
  global.bus.reset();
}

}  // namespace zf::orchestrator

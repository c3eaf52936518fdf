#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "test_util.h"
#include "zf/crypto/provider.h"
#include "zf/orchestrator/container.h"
#include "zf/orchestrator/event_bus.h"
#include "zf/storage/segment_io.h"

namespace {

using namespace zf::orchestrator;

struct Recorder {
  std::mutex mutex;
  std::vector<Event> events;

  bool Saw(const std::string& id) {
    std::lock_guard<std::mutex> guard(mutex);
    return std::any_of(events.begin(), events.end(), [&](const Event& e) { return e.event_id == id; });
  }
};

std::shared_ptr<Recorder> Attach() {
  auto recorder = std::make_shared<Recorder>();
  EventBus::Instance().Subscribe([recorder](const Event& event) {
    std::lock_guard<std::mutex> guard(recorder->mutex);
    recorder->events.push_back(event);
  });
  return recorder;
}

void TestFormatting() {
  Event event;
  event.category = EventCategory::kSecurity;
  event.severity = EventSeverity::kWarning;
  event.event_id = "sample";
  event.message = "quote \" and newline \n";
  event.fields.emplace_back("count", "3", FieldPrivacy::kPublic, true);
  event.fields.emplace_back("secret", "hunter2", FieldPrivacy::kRedact);
  event.fields.emplace_back("path", "/evidence/disk.z01", FieldPrivacy::kHash);
  const auto json = FormatEventJson(event, std::chrono::system_clock::time_point{});
  assert(json.front() == '{' && json.back() == '}' && "single JSON object");
  assert(json.find("\"severity\":\"warning\"") != std::string::npos && "severity rendered");
  assert(json.find("\"category\":\"security\"") != std::string::npos && "category rendered");
  assert(json.find("\"count\":3") != std::string::npos && "public numeric fields are unquoted");
  assert(json.find("hunter2") == std::string::npos && json.find("[REDACTED]") != std::string::npos &&
         "redacted fields never leak");
  assert(json.find("/evidence") == std::string::npos &&
         json.find(HashForTelemetry("/evidence/disk.z01")) != std::string::npos && "hashed fields are digested");
  assert(json.find("\\\"") != std::string::npos && json.find("\\n") != std::string::npos && "strings escaped");
  assert(HashForTelemetry("abc").size() == 16 && "telemetry hash is truncated");
}

void TestSeverityParsing() {
  assert(ParseSeverity("debug") == EventSeverity::kDebug && "debug");
  assert(ParseSeverity("error") == EventSeverity::kError && "error");
  assert(!ParseSeverity("loud") && "unknown level");
}

void TestContainerLifecycleEvents() {
  auto recorder = Attach();
  EventBus::Instance().SetConsoleThreshold(EventSeverity::kCritical);

  WriterOptions options;
  options.chunk_size = 256;
  options.split_size = 1024;
  zf::storage::MemorySinkCollection collection;
  ContainerWriter writer(options, collection.Factory());
  const auto image = zf::test::PatternBytes(4096, 1);
  writer.Write(image);
  (void)writer.Finish();
  assert(recorder->Saw("container_created") && "creation logged");
  assert(recorder->Saw("segment_closed") && "segment rollover logged");
  assert(recorder->Saw("container_finished") && "completion logged");

  auto segments = collection.Segments();
  auto reader = ContainerReader::Open(zf::storage::MemorySources(segments), {});
  assert(recorder->Saw("container_opened") && "open logged");
  const auto* location = reader.index().Find(2);
  segments[location->segment_index][location->payload_offset] ^= 0xFF;
  (void)VerifyContainer(zf::storage::MemorySources(segments), {});
  assert(recorder->Saw("chunk_unrecoverable") && "chunk issue logged");
  assert(recorder->Saw("image_digest_mismatch") && "image mismatch logged");

  std::lock_guard<std::mutex> guard(recorder->mutex);
  for ([[maybe_unused]] const auto& event : recorder->events) {
    for ([[maybe_unused]] const auto& field : event.fields) {
      assert(field.key != "passphrase" && "no key material in events");
    }
  }
}

void TestFileSink() {
  const auto path = std::filesystem::temp_directory_path() / "zf_event_bus_test.jsonl";
  std::filesystem::remove(path);
  ::setenv("ZF_EVENT_LOG", path.c_str(), 1);
  ResetEventBusForTesting();

  Event event;
  event.event_id = "file_sink_line";
  event.message = "sink line";
  EventBus::Instance().Publish(event);

  std::ifstream in(path);
  std::string line;
  std::getline(in, line);
  assert(line.find("\"event_id\":\"file_sink_line\"") != std::string::npos && "file sink writes JSON lines");

  ::unsetenv("ZF_EVENT_LOG");
  ResetEventBusForTesting();
  std::filesystem::remove(path);
}

void TestReentrantPublishSuppressed() {
  ResetEventBusForTesting();
  EventBus::Instance().SetConsoleThreshold(EventSeverity::kCritical);
  auto count = std::make_shared<int>(0);
  EventBus::Instance().Subscribe([count](const Event& event) {
    ++*count;
    EventBus::Instance().Publish(event);
  });
  EventBus::Instance().Publish(Event{});
  assert(*count == 1 && "nested publish is dropped");
}

}  // namespace

int main() {
  zf::crypto::EnsureCryptoProviderInitialized();
  TestFormatting();
  TestSeverityParsing();
  TestContainerLifecycleEvents();
  TestFileSink();
  TestReentrantPublishSuppressed();
  ResetEventBusForTesting();
  std::cout << "event bus test ok\n";
  return 0;
}

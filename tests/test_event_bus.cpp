#include "sp/orchestrator/event_bus.h"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace sp::orchestrator;

std::vector<std::string> ReadLines(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

void TestFieldPrivacy() {
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kWarning;
  event.event_id = "backup_created";
  event.message = "quote \" and newline \n";
  event.fields.emplace_back("reason", "checksum_mismatch");
  event.fields.emplace_back("count", "3", FieldPrivacy::kPublic, true);
  event.fields.emplace_back("secret", "hunter2", FieldPrivacy::kRedact);
  event.fields.emplace_back("identity_ref", "alice@example.com");
  event.fields.emplace_back("log_path", "/home/alice/log");

  const auto json = FormatEventJson(event, "2026-01-01T00:00:00Z");
  assert(json.find("\"ts\":\"2026-01-01T00:00:00Z\"") != std::string::npos);
  assert(json.find("\"severity\":\"warning\"") != std::string::npos);
  assert(json.find("\"category\":\"lifecycle\"") != std::string::npos);
  assert(json.find("\"event_id\":\"backup_created\"") != std::string::npos);
  assert(json.find("quote \\\" and newline \\n") != std::string::npos);
  assert(json.find("\"reason\":\"checksum_mismatch\"") != std::string::npos);
  assert(json.find("\"count\":3") != std::string::npos);
  assert(json.find("\"secret\":\"[REDACTED]\"") != std::string::npos);
  assert(json.find("hunter2") == std::string::npos);
  assert(json.find("alice") == std::string::npos);
  assert(json.find("\"identity_ref\":\"hash:" + HashForTelemetry("alice@example.com") + "\"") !=
         std::string::npos);
  assert(HashForTelemetry("abc") ==
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(HashForTelemetry("").empty());
}

void TestLoggerWritesLines() {
  auto path = std::filesystem::temp_directory_path() /
              ("sp_event_log_" +
               std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".jsonl");
  {
    JsonLineLogger logger(path);
    assert(logger.enabled());
    Event event;
    event.event_id = "first";
    logger.Log(event);
    event.event_id = "second";
    logger.Log(event);

    Event huge;
    huge.event_id = "huge";
    huge.message = std::string(20 * 1024, 'x');
    logger.Log(huge);

    logger.SetPath({});
    assert(!logger.enabled());
    event.event_id = "dropped";
    logger.Log(event);
  }
  auto lines = ReadLines(path);
  assert(lines.size() == 3);
  assert(lines[0].find("\"event_id\":\"first\"") != std::string::npos);
  assert(lines[1].find("\"event_id\":\"second\"") != std::string::npos);
  assert(lines[2].find("\"event_id\":\"event_truncated\"") != std::string::npos);
  assert(lines[2].find("\"original_event_id\":\"huge\"") != std::string::npos);
  std::filesystem::remove(path);
}

void TestBusDeliveryAndReentrancy() {
  ResetEventBusForTesting();
  std::vector<std::string> seen;
  EventBus::Instance().Subscribe([&seen](const Event& event) {
    seen.push_back(event.event_id);
    Event nested;
    nested.event_id = "nested";
    EventBus::Instance().Publish(nested);
  });
  Event event;
  event.event_id = "outer";
  EventBus::Instance().Publish(event);
  assert(seen.size() == 1);
  assert(seen[0] == "outer");
  ResetEventBusForTesting();
}

}  // namespace

int main() {
  TestFieldPrivacy();
  TestLoggerWritesLines();
  TestBusDeliveryAndReentrancy();
  std::cout << "event bus tests ok\n";
  return 0;
}

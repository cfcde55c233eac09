#include "secenv/common.h"
#include "secenv/orchestrator/event_bus.h"

#include <nlohmann/json.hpp>

#include <cassert>
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace secenv::orchestrator;

Event SampleEvent(EventSeverity severity) {
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = severity;
  event.event_id = "backup_completed";
  event.message = "Backup \"written\"\n";
  event.fields.emplace_back("project", "my-app", FieldPrivacy::kHash);
  event.fields.emplace_back("token", "ghp_secret", FieldPrivacy::kRedact);
  event.fields.emplace_back("file_count", "2", FieldPrivacy::kPublic, true);
  event.fields.emplace_back("operation", "backup");
  return event;
}

void TestFormatAppliesPrivacy() {
  const auto line = FormatEventJson(SampleEvent(EventSeverity::kInfo), std::chrono::system_clock::now());
  assert(line.find('\n') == std::string::npos);
  assert(line.find("ghp_secret") == std::string::npos);
  assert(line.find("my-app") == std::string::npos);

  auto doc = nlohmann::json::parse(line);
  assert(doc["severity"] == "info");
  assert(doc["category"] == "lifecycle");
  assert(doc["event_id"] == "backup_completed");
  assert(doc["message"] == "Backup \"written\"\n");
  assert(doc["project"] == HashForTelemetry("my-app"));
  assert(doc["token"] == "[redacted]");
  assert(doc["file_count"] == 2);
  assert(doc["operation"] == "backup");
}

void TestTimestampPrecision() {
  using namespace std::chrono;
  const sys_days day = year{2024} / January / 1;
  const auto tp = day + hours{12} + microseconds{7007};
  auto doc = nlohmann::json::parse(FormatEventJson(SampleEvent(EventSeverity::kInfo), tp));
  assert(doc["ts"] == "2024-01-01T12:00:00.007007Z");
  assert(secenv::FormatUtcTimestamp(tp, secenv::TimestampPrecision::kMillis) == "2024-01-01T12:00:00.007Z");
}

void TestSeverityParsing() {
  assert(ParseSeverity("INFO") == EventSeverity::kInfo);
  assert(ParseSeverity("warning") == EventSeverity::kWarning);
  assert(!ParseSeverity("loud").has_value());
  assert(HashForTelemetry("").empty());
}

void TestLoggerThreshold() {
  std::ostringstream out;
  JsonLineLogger logger(out);
  logger.SetMinimumSeverity(EventSeverity::kWarning);
  logger.Log(SampleEvent(EventSeverity::kInfo));
  assert(out.str().empty());
  logger.Log(SampleEvent(EventSeverity::kError));
  assert(!out.str().empty());
  assert(out.str().back() == '\n');

  logger.SetMinimumSeverity(EventSeverity::kDebug);
  assert(logger.MinimumSeverity() == EventSeverity::kDebug);
  logger.Log(SampleEvent(EventSeverity::kDebug));
  std::istringstream lines(out.str());
  std::string line;
  int count = 0;
  while (std::getline(lines, line)) {
    (void)nlohmann::json::parse(line);
    ++count;
  }
  assert(count == 2);
}

void TestSubscribersAndReset() {
  ResetEventBusForTesting();
  std::vector<std::string> seen;
  EventBus::Instance().Subscribe([&seen](const Event& e) { seen.push_back(e.event_id); });
  EventBus::Instance().Publish(SampleEvent(EventSeverity::kDebug));
  assert(seen.size() == 1 && seen.front() == "backup_completed");

  // Publishing from inside a subscriber is suppressed instead of recursing.
  int nested = 0;
  EventBus::Instance().Subscribe([&nested](const Event& e) {
    if (e.event_id == "outer") {
      Event inner;
      inner.event_id = "inner";
      EventBus::Instance().Publish(inner);
    } else if (e.event_id == "inner") {
      ++nested;
    }
  });
  Event outer;
  outer.event_id = "outer";
  EventBus::Instance().Publish(outer);
  assert(nested == 0);

  ResetEventBusForTesting();
  seen.clear();
  EventBus::Instance().Publish(SampleEvent(EventSeverity::kDebug));
  assert(seen.empty());
}

} // namespace

int main() {
  TestFormatAppliesPrivacy();
  TestTimestampPrecision();
  TestSeverityParsing();
  TestLoggerThreshold();
  TestSubscribersAndReset();
  std::cout << "event bus tests ok\n";
  return 0;
}

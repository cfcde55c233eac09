#include "secenv/orchestrator/event_bus.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "secenv/common.h"
#include "secenv/crypto/sha256.h"

namespace secenv::orchestrator {
namespace {

struct EventBusSingletonStorage {
  std::once_flag once;
  std::unique_ptr<EventBus> instance;
};

std::mutex& EventBusSingletonMutex() {
  static std::mutex mutex;
  return mutex;
}

EventBusSingletonStorage& EventBusSingleton() {
  static EventBusSingletonStorage storage;
  return storage;
}

struct PublishReentrancyGuard {
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

std::string EscapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        char buffer[7];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<int>(c));
        out += buffer;
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
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

EventSeverity ResolveDefaultSeverity() {
  const char* env = std::getenv("SECENV_LOG_LEVEL");
  if (!env || *env == '\0') {
    return EventSeverity::kWarning;
  }
  return ParseSeverity(env).value_or(EventSeverity::kWarning);
}

} // namespace

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  return secenv::crypto::SHA256_Hex(input);
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

std::optional<EventSeverity> ParseSeverity(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (auto severity : {EventSeverity::kDebug, EventSeverity::kInfo, EventSeverity::kWarning,
                        EventSeverity::kError, EventSeverity::kCritical}) {
    if (lowered == SeverityToString(severity)) {
      return severity;
    }
  }
  return std::nullopt;
}

std::string FormatEventJson(const Event& event, std::chrono::system_clock::time_point ts) {
  std::string payload;
  payload.reserve(256);
  payload += "{\"ts\":\"";
  payload += FormatUtcTimestamp(ts, TimestampPrecision::kMicros);
  payload += "\",\"severity\":\"";
  payload += SeverityToString(event.severity);
  payload += "\",\"category\":\"";
  payload += CategoryToString(event.category);
  payload += "\"";
  if (!event.event_id.empty()) {
    payload += ",\"event_id\":\"";
    payload += EscapeJson(event.event_id);
    payload += "\"";
  }
  if (!event.message.empty()) {
    payload += ",\"message\":\"";
    payload += EscapeJson(event.message);
    payload += "\"";
  }
  for (const auto& field : event.fields) {
    payload += ",\"";
    payload += EscapeJson(field.key);
    payload += "\":";
    std::string sanitized = field.value;
    if (field.privacy == FieldPrivacy::kRedact) {
      sanitized = "[redacted]";
    } else if (field.privacy == FieldPrivacy::kHash) {
      sanitized = HashForTelemetry(field.value);
    }
    if (field.numeric && field.privacy == FieldPrivacy::kPublic) {
      payload += sanitized;
    } else {
      payload += "\"";
      payload += EscapeJson(sanitized);
      payload += "\"";
    }
  }
  payload += "}";
  return payload;
}

JsonLineLogger::JsonLineLogger() : JsonLineLogger(std::clog) {}

JsonLineLogger::JsonLineLogger(std::ostream& out)
    : out_(&out), minimum_(ResolveDefaultSeverity()) {}

void JsonLineLogger::Log(const Event& event) {
  if (event.severity < minimum_.load(std::memory_order_relaxed)) {
    return;
  }
  auto line = FormatEventJson(event, std::chrono::system_clock::now());
  std::lock_guard<std::mutex> guard(mutex_);
  *out_ << line << '\n';
  out_->flush();
}

void JsonLineLogger::SetMinimumSeverity(EventSeverity severity) {
  minimum_.store(severity, std::memory_order_relaxed);
}

EventSeverity JsonLineLogger::MinimumSeverity() const {
  return minimum_.load(std::memory_order_relaxed);
}

JsonLineLogger& DefaultJsonLogger() {
  static JsonLineLogger logger;
  return logger;
}

EventBus::EventBus() {
  ResetSubscribers();
}

void EventBus::ResetSubscribers() {
  auto initial = std::make_shared<SubscriberList>();
  initial->push_back([](const Event& e) { DefaultJsonLogger().Log(e); });
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  std::atomic_store_explicit(&subscribers_snapshot_,
                             std::const_pointer_cast<const SubscriberList>(initial),
                             std::memory_order_release);
}

EventBus& EventBus::Instance() {
  auto& storage = EventBusSingleton();
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  std::call_once(storage.once, [&storage]() {
    storage.instance = std::make_unique<EventBus>();
  });
  return *storage.instance;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard guard(in_publish);
  auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  if (!targets) {
    return;
  }
  for (const auto& subscriber : *targets) {
    if (subscriber) {
      subscriber(event);
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  auto updated = current ? std::make_shared<SubscriberList>(*current)
                         : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_,
                             std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
}

void ResetEventBusForTesting() {
  EventBus::Instance().ResetSubscribers();
  DefaultJsonLogger().SetMinimumSeverity(ResolveDefaultSeverity());
}

} // namespace secenv::orchestrator

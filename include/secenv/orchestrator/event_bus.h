#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace secenv::orchestrator {

  // Structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

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

  // Lowercase SHA-256 hex of |input|; empty input stays empty.
  std::string HashForTelemetry(std::string_view input);

  const char* SeverityToString(EventSeverity severity);
  std::optional<EventSeverity> ParseSeverity(std::string_view text);

  // Renders |event| as a single JSON object with privacy rules applied.
  std::string FormatEventJson(const Event& event, std::chrono::system_clock::time_point ts);

  // Writes one JSON object per line for events at or above the minimum
  // severity. The minimum defaults to warning and can be overridden with
  // SECENV_LOG_LEVEL.
  class JsonLineLogger {
  public:
    JsonLineLogger();
    explicit JsonLineLogger(std::ostream& out);

    void Log(const Event& event);
    void SetMinimumSeverity(EventSeverity severity);
    EventSeverity MinimumSeverity() const;

  private:
    std::mutex mutex_;
    std::ostream* out_;
    std::atomic<EventSeverity> minimum_{EventSeverity::kWarning};
  };

  JsonLineLogger& DefaultJsonLogger();

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    EventBus();

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

  private:
    friend void ResetEventBusForTesting();
    void ResetSubscribers();

    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  // Drops all subscribers and reinstalls the default logger.
  void ResetEventBusForTesting();

} // namespace secenv::orchestrator

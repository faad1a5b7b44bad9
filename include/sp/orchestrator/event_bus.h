#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <memory>
#include <mutex>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "sp/crypto/sha256.h"

namespace sp::orchestrator {

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

  inline std::string HashForTelemetry(std::string_view input) {
    if (input.empty()) {
      return "";
    }
    auto digest = sp::crypto::SHA256_Hash(input);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : digest) {
      oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
  }

  // One JSON object per line. Writes to SP_LOG_PATH; does nothing when the
  // variable is unset or empty.
  class JsonLineLogger {
  public:
    JsonLineLogger();
    explicit JsonLineLogger(std::filesystem::path log_path, size_t max_bytes = kDefaultMaxBytes);
    void Log(const Event& event);
    // Switches to |log_path|; an empty path disables the logger.
    void SetPath(std::filesystem::path log_path);
    bool enabled();

    static constexpr size_t kDefaultMaxBytes = 10 * 1024 * 1024;

  private:
    std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
    void EnsureOpen();
    void RotateIfNeeded(size_t incoming_bytes);

    std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    size_t max_bytes_;
    const size_t max_files_ = 3;
  };

  JsonLineLogger& DefaultJsonLogger();

  // Serializes |event| the way JsonLineLogger writes it, without the trailing
  // newline. Exposed for subscribers that forward events elsewhere.
  std::string FormatEventJson(const Event& event, const std::string& timestamp);

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    // Delivers synchronously to every subscriber on the calling thread.
    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

    EventBus();
    ~EventBus();

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  void ResetEventBusForTesting();

} // namespace sp::orchestrator

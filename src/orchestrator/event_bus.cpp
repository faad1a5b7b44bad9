#include "sp/orchestrator/event_bus.h"

#include "sp/common.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <new>
#include <string>
#include <string_view>

namespace sp::orchestrator {
namespace {

struct EventBusSingletonStorage {
  std::once_flag once;
  std::unique_ptr<EventBus> instance;

  void Reset() {
    instance.reset();
    this->~EventBusSingletonStorage();
    new (this) EventBusSingletonStorage();
  }
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

constexpr size_t kMaxEventBytes = 16 * 1024;

std::string HashTag(std::string_view value) {
  return std::string{"hash:"} + HashForTelemetry(value);
}

// Keys that may carry an identity reference or a path are hashed even when
// the publisher marked them public.
bool FieldKeyImpliesSensitive(std::string_view key) {
  std::string lowered;
  lowered.reserve(key.size());
  for (char ch : key) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  return lowered.find("path") != std::string::npos || lowered.find("identity") != std::string::npos ||
         lowered.find("passphrase") != std::string::npos;
}

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
        std::ostringstream hex;
        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
        out += hex.str();
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
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

std::filesystem::path ResolveLogPath() {
  const char* env = std::getenv("SP_LOG_PATH");
  if (!env || *env == '\0') {
    return {};
  }
  return std::filesystem::path(env);
}

} // namespace

std::string FormatEventJson(const Event& event, const std::string& timestamp) {
  std::string payload;
  payload.reserve(256);
  payload.append("{\"ts\":\"").append(EscapeJson(timestamp)).append("\"");
  payload.append(",\"severity\":\"").append(SeverityToString(event.severity)).append("\"");
  payload.append(",\"category\":\"").append(CategoryToString(event.category)).append("\"");
  if (!event.event_id.empty()) {
    payload.append(",\"event_id\":\"").append(EscapeJson(event.event_id)).append("\"");
  }
  if (!event.message.empty()) {
    payload.append(",\"message\":\"").append(EscapeJson(event.message)).append("\"");
  }
  for (const auto& field : event.fields) {
    auto privacy = field.privacy;
    if (privacy == FieldPrivacy::kPublic && FieldKeyImpliesSensitive(field.key)) {
      privacy = FieldPrivacy::kHash;
    }
    std::string sanitized = field.value;
    if (privacy == FieldPrivacy::kRedact) {
      sanitized = "[REDACTED]";
    } else if (privacy == FieldPrivacy::kHash) {
      sanitized = HashTag(field.value);
    }
    payload.append(",\"").append(EscapeJson(field.key)).append("\":");
    if (field.numeric && privacy == FieldPrivacy::kPublic) {
      payload.append(sanitized);
    } else {
      payload.append("\"").append(EscapeJson(sanitized)).append("\"");
    }
  }
  payload.push_back('}');
  return payload;
}

JsonLineLogger::JsonLineLogger() : JsonLineLogger(ResolveLogPath()) {}

JsonLineLogger::JsonLineLogger(std::filesystem::path log_path, size_t max_bytes)
    : log_path_(std::move(log_path)), max_bytes_(max_bytes == 0 ? kDefaultMaxBytes : max_bytes) {}

JsonLineLogger& DefaultJsonLogger() {
  static JsonLineLogger logger;
  return logger;
}

std::string JsonLineLogger::FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

void JsonLineLogger::EnsureOpen() {
  if (stream_.is_open()) {
    return;
  }
  std::error_code ec;
  auto parent = log_path_.parent_path();
  if (!parent.empty()) {
    const bool parent_exists = std::filesystem::exists(parent, ec);
    if (ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"log directory stat failed\",\"error_code\":"
                << ec.value() << "}" << std::endl;
      return;
    }
    if (!parent_exists) {
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        std::clog << "{\"event\":\"logger_error\",\"message\":\"log directory create failed\",\"error_code\":"
                  << ec.value() << "}" << std::endl;
        return;
      }
    }
  }
  stream_.open(log_path_, std::ios::out | std::ios::app);
}

void JsonLineLogger::RotateIfNeeded(size_t incoming_bytes) {
  std::error_code ec;
  auto current_size = std::filesystem::file_size(log_path_, ec);
  if (ec) {
    // Missing file is the normal first-write case.
    current_size = 0;
    ec.clear();
  }
  if (current_size + incoming_bytes <= max_bytes_) {
    return;
  }
  if (stream_.is_open()) {
    stream_.close();
  }
  for (size_t idx = max_files_; idx > 0; --idx) {
    std::filesystem::path src =
        idx == 1 ? log_path_ : std::filesystem::path(log_path_.string() + "." + std::to_string(idx - 1));
    std::filesystem::path dst = std::filesystem::path(log_path_.string() + "." + std::to_string(idx));
    std::error_code rotate_ec;
    const bool source_exists = std::filesystem::exists(src, rotate_ec);
    if (rotate_ec || !source_exists) {
      continue;
    }
    std::filesystem::remove(dst, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"log rotation cleanup failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
      rotate_ec.clear();
    }
    std::filesystem::rename(src, dst, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"log rotate rename failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
    }
  }
}

void JsonLineLogger::SetPath(std::filesystem::path log_path) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (log_path == log_path_) {
    return;
  }
  if (stream_.is_open()) {
    stream_.close();
  }
  log_path_ = std::move(log_path);
}

bool JsonLineLogger::enabled() {
  std::lock_guard<std::mutex> guard(mutex_);
  return !log_path_.empty();
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (log_path_.empty()) {
    return;
  }
  auto line = FormatEventJson(event, FormatTimestamp(std::chrono::system_clock::now()));
  if (line.size() > kMaxEventBytes) {
    Event replacement;
    replacement.category = event.category;
    replacement.severity = event.severity;
    replacement.event_id = "event_truncated";
    replacement.message = "Event exceeded size limit";
    replacement.fields.emplace_back("original_event_id", event.event_id);
    line = FormatEventJson(replacement, FormatTimestamp(std::chrono::system_clock::now()));
  }
  RotateIfNeeded(line.size() + 1);
  EnsureOpen();
  if (!stream_.is_open()) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"failed to open log file\"}" << std::endl;
    return;
  }
  stream_ << line << '\n';
  stream_.flush();
}

EventBus::EventBus() {
  auto initial = std::make_shared<SubscriberList>();
  initial->push_back([](const Event& e) { DefaultJsonLogger().Log(e); });
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(initial),
                             std::memory_order_release);
}

EventBus::~EventBus() {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  std::atomic_store_explicit(&subscribers_snapshot_, std::shared_ptr<const SubscriberList>{},
                             std::memory_order_release);
}

EventBus& EventBus::Instance() {
  auto& storage = EventBusSingleton();
  {
    std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
    std::call_once(storage.once, [&storage]() { storage.instance = std::make_unique<EventBus>(); });
  }
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
  auto updated = current ? std::make_shared<SubscriberList>(*current) : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
}

void ResetEventBusForTesting() {
  auto& storage = EventBusSingleton();
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  storage.Reset();
}

} // namespace sp::orchestrator

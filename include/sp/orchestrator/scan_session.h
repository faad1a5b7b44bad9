#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "sp/core/frame_assembler.h"
#include "sp/orchestrator/identity_store.h"

namespace sp::orchestrator {

struct ScanUpdate {
  enum class Kind {
    kProgress,   // a frame was stored or was a duplicate
    kRejected,   // the attempt was discarded; scanning continues from empty
    kCompleted,  // seed verified and written to the store
    kFailed,     // verified, but the store write failed
  };
  Kind kind{Kind::kProgress};
  uint32_t received{0};
  uint32_t total{0};
  std::optional<core::FrameAssembler::RejectReason> reason;
  std::string detail;
};

// Feeds scanner callbacks into one FrameAssembler on a dedicated worker
// thread. Offer() may be called from any thread. Validation runs on the
// worker; frames offered while it runs are refused.
class ScanSession {
public:
  using Listener = std::function<void(const ScanUpdate&)>;

  static constexpr size_t kDefaultQueueCapacity = 16;

  // |store| must outlive the session. |listener| runs on the worker thread.
  explicit ScanSession(IdentityStore& store, Listener listener = {},
                       size_t queue_capacity = kDefaultQueueCapacity);
  ~ScanSession();
  ScanSession(const ScanSession&) = delete;
  ScanSession& operator=(const ScanSession&) = delete;

  // False when the frame was dropped: queue full, validation in progress,
  // already finished or cancelled.
  bool Offer(std::string text);

  // Blocks until the session completes or fails, or |timeout| passes.
  std::optional<ScanUpdate> WaitForCompletion(std::chrono::milliseconds timeout);

  // Stops the worker. Pending frames are discarded; the store is untouched
  // unless validation had already succeeded.
  void Cancel();

  bool finished() const;

private:
  void Run();
  void Process(const std::string& text);
  // Drops the current attempt after an unexpected failure and resumes scanning.
  void Recover(const std::string& detail);
  void Notify(const ScanUpdate& update);
  ScanUpdate Snapshot(ScanUpdate::Kind kind) const;

  IdentityStore& store_;
  Listener listener_;
  const size_t capacity_;
  core::FrameAssembler assembler_; // worker thread only

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable done_cv_;
  std::deque<std::string> queue_;
  bool accepting_{true};
  bool stopping_{false};
  std::optional<ScanUpdate> final_;
  std::thread worker_;
};

} // namespace sp::orchestrator

#include "sp/orchestrator/scan_session.h"

#include "sp/error.h"
#include "sp/orchestrator/event_bus.h"
#include "sp/security/zeroizer.h"

#include <exception>
#include <utility>

namespace sp::orchestrator {
namespace {

using sp::security::Zeroizer;

void PublishScanEvent(EventSeverity severity, std::string event_id, std::string message,
                      std::vector<EventField> fields = {}) {
  Event event;
  event.category = EventCategory::kSecurity;
  event.severity = severity;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields = std::move(fields);
  EventBus::Instance().Publish(event);
}

} // namespace

ScanSession::ScanSession(IdentityStore& store, Listener listener, size_t queue_capacity)
    : store_(store), listener_(std::move(listener)), capacity_(queue_capacity == 0 ? 1 : queue_capacity) {
  worker_ = std::thread([this]() { Run(); });
}

ScanSession::~ScanSession() {
  Cancel();
}

void ScanSession::Cancel() {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    stopping_ = true;
    accepting_ = false;
    for (auto& pending : queue_) {
      Zeroizer::WipeString(pending);
    }
    queue_.clear();
  }
  work_cv_.notify_all();
  done_cv_.notify_all();
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
    worker_.join();
  }
}

bool ScanSession::Offer(std::string text) {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (!accepting_ || stopping_ || queue_.size() >= capacity_) {
      Zeroizer::WipeString(text);
      return false;
    }
    queue_.push_back(std::move(text));
  }
  work_cv_.notify_one();
  return true;
}

bool ScanSession::finished() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return final_.has_value();
}

std::optional<ScanUpdate> ScanSession::WaitForCompletion(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  done_cv_.wait_for(lock, timeout, [this]() { return final_.has_value() || stopping_; });
  return final_;
}

void ScanSession::Run() {
  while (true) {
    std::string text;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (stopping_ || final_) {
        return;
      }
      text = std::move(queue_.front());
      queue_.pop_front();
    }
    try {
      Process(text);
    } catch (const std::exception& ex) {
      Recover(ex.what());
    }
    Zeroizer::WipeString(text);
    std::lock_guard<std::mutex> guard(mutex_);
    if (final_) {
      return;
    }
  }
}

ScanUpdate ScanSession::Snapshot(ScanUpdate::Kind kind) const {
  ScanUpdate update;
  update.kind = kind;
  const auto progress = assembler_.Progress();
  update.received = progress.first;
  update.total = progress.second;
  return update;
}

void ScanSession::Notify(const ScanUpdate& update) {
  if (!listener_) {
    return;
  }
  try {
    listener_(update);
  } catch (const std::exception& ex) {
    // A throwing listener must not take down the worker.
    PublishScanEvent(EventSeverity::kWarning, "scan_listener_error", "Scan listener threw",
                     {EventField("error", ex.what())});
  }
}

void ScanSession::Recover(const std::string& detail) {
  assembler_.Reset();
  PublishScanEvent(EventSeverity::kError, "qr_transfer_error", "QR transfer attempt aborted",
                   {EventField("error", detail)});
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (!stopping_ && !final_) {
      accepting_ = true;
    }
  }
  ScanUpdate update = Snapshot(ScanUpdate::Kind::kRejected);
  update.reason = core::FrameAssembler::RejectReason::kInternalError;
  update.detail = detail;
  Notify(update);
}

void ScanSession::Process(const std::string& text) {
  auto outcome = assembler_.Accept(text);
  using Status = core::FrameAssembler::Status;

  if (outcome.status == Status::kReadyToValidate) {
    {
      std::lock_guard<std::mutex> guard(mutex_);
      accepting_ = false;
      for (auto& pending : queue_) {
        Zeroizer::WipeString(pending);
      }
      queue_.clear();
    }
    outcome = assembler_.Validate();
  }

  switch (outcome.status) {
  case Status::kStored:
  case Status::kDuplicate:
    Notify(Snapshot(ScanUpdate::Kind::kProgress));
    return;
  case Status::kIgnored:
  case Status::kReadyToValidate:
    return;
  case Status::kRejected: {
    ScanUpdate update = Snapshot(ScanUpdate::Kind::kRejected);
    update.reason = outcome.reason;
    update.detail = outcome.detail;
    PublishScanEvent(EventSeverity::kWarning, "qr_transfer_rejected", "QR transfer attempt rejected",
                     {EventField("reason", core::ToString(*outcome.reason))});
    {
      std::lock_guard<std::mutex> guard(mutex_);
      if (!stopping_) {
        accepting_ = true;
      }
    }
    Notify(update);
    return;
  }
  case Status::kSucceeded:
    break;
  }

  ScanUpdate update = Snapshot(ScanUpdate::Kind::kCompleted);
  try {
    store_.Set(*assembler_.seed());
    PublishScanEvent(EventSeverity::kInfo, "qr_transfer_completed", "Identity imported from QR frames");
  } catch (const Error& err) {
    update.kind = ScanUpdate::Kind::kFailed;
    update.detail = err.what();
    PublishScanEvent(EventSeverity::kError, "qr_transfer_store_failed", "Imported identity could not be stored",
                     {EventField("code", std::to_string(err.code), FieldPrivacy::kPublic, true)});
  } catch (const std::exception& ex) {
    update.kind = ScanUpdate::Kind::kFailed;
    update.detail = ex.what();
    PublishScanEvent(EventSeverity::kError, "qr_transfer_store_failed", "Imported identity could not be stored");
  }
  assembler_.Reset();
  {
    std::lock_guard<std::mutex> guard(mutex_);
    final_ = update;
  }
  done_cv_.notify_all();
  Notify(update);
}

} // namespace sp::orchestrator

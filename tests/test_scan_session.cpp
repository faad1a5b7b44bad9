#include "sp/codec/mnemonic.h"
#include "sp/codec/qr_frame.h"
#include "sp/core/seed.h"
#include "sp/crypto/provider.h"
#include "sp/error.h"
#include "sp/orchestrator/event_bus.h"
#include "sp/orchestrator/identity_store.h"
#include "sp/orchestrator/scan_session.h"

#include <array>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using sp::orchestrator::ScanSession;
using sp::orchestrator::ScanUpdate;
using namespace std::chrono_literals;

std::array<std::string, sp::codec::kFrameCount> EncodedFrames(const sp::core::Seed& seed) {
  auto frames = sp::codec::SplitIntoFrames(sp::codec::EncodeMnemonic(seed), seed);
  std::array<std::string, sp::codec::kFrameCount> out;
  for (size_t i = 0; i < frames.size(); ++i) {
    out[i] = sp::codec::EncodeFrame(frames[i]);
  }
  return out;
}

class UpdateRecorder {
public:
  ScanSession::Listener Listener() {
    return [this](const ScanUpdate& update) {
      {
        std::lock_guard<std::mutex> guard(mutex_);
        updates_.push_back(update);
      }
      cv_.notify_all();
    };
  }

  bool WaitFor(ScanUpdate::Kind kind, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]() {
      for (const auto& update : updates_) {
        if (update.kind == kind) {
          return true;
        }
      }
      return false;
    });
  }

  std::vector<ScanUpdate> Updates() {
    std::lock_guard<std::mutex> guard(mutex_);
    return updates_;
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<ScanUpdate> updates_;
};

class FailingStore : public sp::orchestrator::IdentityStore {
public:
  std::optional<sp::core::Seed> Get() override { return std::nullopt; }
  void Set(const sp::core::Seed&) override {
    throw sp::Error{sp::ErrorDomain::IO, 5, "disk full"};
  }
};

class FailingMacProvider : public sp::crypto::OpenSSLCryptoProvider {
public:
  std::array<uint8_t, 32> HMACSHA256(std::span<const uint8_t>, std::span<const uint8_t>) override {
    throw sp::Error(sp::ErrorDomain::Crypto, 0, "hmac backend failure");
  }
};

// Holds every HMAC call until Release() so a validation can be observed mid-flight.
class GatedMacProvider : public sp::crypto::OpenSSLCryptoProvider {
public:
  std::array<uint8_t, 32> HMACSHA256(std::span<const uint8_t> key, std::span<const uint8_t> message) override {
    std::unique_lock<std::mutex> lock(mutex_);
    entered_ = true;
    cv_.notify_all();
    cv_.wait(lock, [this]() { return released_; });
    lock.unlock();
    return OpenSSLCryptoProvider::HMACSHA256(key, message);
  }

  bool WaitEntered(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return entered_; });
  }

  void Release() {
    {
      std::lock_guard<std::mutex> guard(mutex_);
      released_ = true;
    }
    cv_.notify_all();
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool entered_{false};
  bool released_{false};
};

void TestCompletes() {
  auto seed = sp::core::Seed::Generate();
  auto frames = EncodedFrames(seed);
  sp::orchestrator::MemoryIdentityStore store;
  UpdateRecorder recorder;
  ScanSession session(store, recorder.Listener());

  assert(session.Offer(frames[2]));
  assert(session.Offer(frames[0]));
  assert(session.Offer(frames[1]));
  auto result = session.WaitForCompletion(5s);
  assert(result.has_value());
  assert(result->kind == ScanUpdate::Kind::kCompleted);
  assert(result->received == 3 && result->total == 3);
  assert(session.finished());
  assert(store.Get() && *store.Get() == seed);
  assert(!session.Offer(frames[0]));

  assert(recorder.WaitFor(ScanUpdate::Kind::kCompleted, 5s));
  auto updates = recorder.Updates();
  assert(updates.front().kind == ScanUpdate::Kind::kProgress);
  assert(updates.front().received == 1);
}

void TestRejectThenRetry() {
  auto seed = sp::core::Seed::Generate();
  auto frames = EncodedFrames(seed);
  std::string tampered = frames[2];
  tampered.back() = tampered.back() == 'a' ? 'b' : 'a';

  sp::orchestrator::MemoryIdentityStore store;
  UpdateRecorder recorder;
  ScanSession session(store, recorder.Listener());

  assert(session.Offer(frames[0]));
  assert(session.Offer(frames[1]));
  assert(session.Offer(tampered));
  assert(recorder.WaitFor(ScanUpdate::Kind::kRejected, 5s));
  assert(!session.finished());
  assert(!store.Get().has_value());

  bool saw_reason = false;
  for (const auto& update : recorder.Updates()) {
    if (update.kind == ScanUpdate::Kind::kRejected) {
      saw_reason = update.reason == sp::core::FrameAssembler::RejectReason::kChecksumMismatch;
      assert(update.received == 0);
    }
  }
  assert(saw_reason);

  for (const auto& frame : frames) {
    assert(session.Offer(frame));
  }
  auto result = session.WaitForCompletion(5s);
  assert(result && result->kind == ScanUpdate::Kind::kCompleted);
  assert(*store.Get() == seed);
}

void TestStoreFailure() {
  auto frames = EncodedFrames(sp::core::Seed::Generate());
  FailingStore store;
  ScanSession session(store);
  for (const auto& frame : frames) {
    assert(session.Offer(frame));
  }
  auto result = session.WaitForCompletion(5s);
  assert(result && result->kind == ScanUpdate::Kind::kFailed);
  assert(result->detail == "disk full");
}

void TestFramesRefusedWhileValidating() {
  auto seed = sp::core::Seed::Generate();
  auto frames = EncodedFrames(seed);
  auto previous = sp::crypto::GetCryptoProviderShared();
  auto gated = std::make_shared<GatedMacProvider>();
  sp::crypto::SetCryptoProvider(gated);

  sp::orchestrator::MemoryIdentityStore store;
  ScanSession session(store);
  for (const auto& frame : frames) {
    assert(session.Offer(frame));
  }
  assert(gated->WaitEntered(5s));
  assert(!session.Offer(frames[0]));
  assert(!session.Offer(frames[2]));
  assert(!session.finished());

  gated->Release();
  auto result = session.WaitForCompletion(5s);
  assert(result && result->kind == ScanUpdate::Kind::kCompleted);
  assert(*store.Get() == seed);
  sp::crypto::SetCryptoProvider(previous);
}

void TestDigestFailureResumesScanning() {
  auto seed = sp::core::Seed::Generate();
  auto frames = EncodedFrames(seed);
  auto previous = sp::crypto::GetCryptoProviderShared();
  sp::crypto::SetCryptoProvider(std::make_shared<FailingMacProvider>());

  sp::orchestrator::MemoryIdentityStore store;
  UpdateRecorder recorder;
  ScanSession session(store, recorder.Listener());
  for (const auto& frame : frames) {
    assert(session.Offer(frame));
  }
  assert(recorder.WaitFor(ScanUpdate::Kind::kRejected, 5s));
  assert(!session.finished());
  assert(!store.Get().has_value());
  bool saw_reason = false;
  for (const auto& update : recorder.Updates()) {
    if (update.kind == ScanUpdate::Kind::kRejected) {
      saw_reason = update.reason == sp::core::FrameAssembler::RejectReason::kInternalError;
    }
  }
  assert(saw_reason);

  sp::crypto::SetCryptoProvider(previous);
  for (const auto& frame : frames) {
    assert(session.Offer(frame));
  }
  auto result = session.WaitForCompletion(5s);
  assert(result && result->kind == ScanUpdate::Kind::kCompleted);
  assert(*store.Get() == seed);
}

void TestListenerErrorIsLoggedEscaped() {
  sp::orchestrator::ResetEventBusForTesting();
  std::mutex mutex;
  std::condition_variable cv;
  std::vector<std::string> lines;
  sp::orchestrator::EventBus::Instance().Subscribe([&](const sp::orchestrator::Event& event) {
    if (event.event_id != "scan_listener_error") {
      return;
    }
    {
      std::lock_guard<std::mutex> guard(mutex);
      lines.push_back(sp::orchestrator::FormatEventJson(event, "test"));
    }
    cv.notify_all();
  });

  sp::orchestrator::MemoryIdentityStore store;
  auto frames = EncodedFrames(sp::core::Seed::Generate());
  {
    ScanSession session(store, [](const ScanUpdate&) { throw std::runtime_error("bad \"quote\""); });
    assert(session.Offer(frames[0]));
    std::unique_lock<std::mutex> lock(mutex);
    assert(cv.wait_for(lock, 5s, [&]() { return !lines.empty(); }));
    assert(lines.front().find("bad \\\"quote\\\"") != std::string::npos);
  }
  sp::orchestrator::ResetEventBusForTesting();
}

void TestCancelAndCapacity() {
  sp::orchestrator::MemoryIdentityStore store;
  auto session = std::make_unique<ScanSession>(
      store, [](const ScanUpdate&) { throw std::runtime_error("listener failure"); }, 1);
  auto frames = EncodedFrames(sp::core::Seed::Generate());
  (void)session->Offer(frames[0]);
  session->Cancel();
  assert(!session->Offer(frames[1]));
  assert(!session->WaitForCompletion(10ms).has_value());
  session.reset();
  assert(!store.Get().has_value());
}

}  // namespace

int main() {
  TestCompletes();
  TestRejectThenRetry();
  TestStoreFailure();
  TestFramesRefusedWhileValidating();
  TestDigestFailureResumesScanning();
  TestListenerErrorIsLoggedEscaped();
  TestCancelAndCapacity();
  std::cout << "scan session tests ok\n";
  return 0;
}

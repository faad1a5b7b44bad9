#include "sp/codec/mnemonic.h"
#include "sp/codec/qr_frame.h"
#include "sp/core/frame_assembler.h"
#include "sp/core/seed.h"
#include "sp/crypto/provider.h"
#include "sp/error.h"

#include <array>
#include <cassert>
#include <cstring>
#include <iostream>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace {

using sp::core::FrameAssembler;
using Status = FrameAssembler::Status;
using Phase = FrameAssembler::Phase;
using Reason = FrameAssembler::RejectReason;

std::array<std::string, sp::codec::kFrameCount> EncodedFrames(const sp::core::Seed& seed) {
  auto frames = sp::codec::SplitIntoFrames(sp::codec::EncodeMnemonic(seed), seed);
  std::array<std::string, sp::codec::kFrameCount> out;
  for (size_t i = 0; i < frames.size(); ++i) {
    out[i] = sp::codec::EncodeFrame(frames[i]);
  }
  return out;
}

// OpenSSL for everything except HMAC, which fails the way a broken backend would.
class FailingMacProvider : public sp::crypto::OpenSSLCryptoProvider {
public:
  std::array<uint8_t, 32> HMACSHA256(std::span<const uint8_t>, std::span<const uint8_t>) override {
    throw sp::Error(sp::ErrorDomain::Crypto, 0, "hmac backend failure");
  }
};

void TestAnyOrder() {
  const std::array<std::array<int, 3>, 6> orders{{
      {0, 1, 2}, {0, 2, 1}, {1, 0, 2}, {1, 2, 0}, {2, 0, 1}, {2, 1, 0}}};
  for (const auto& order : orders) {
    auto seed = sp::core::Seed::Generate();
    auto frames = EncodedFrames(seed);
    FrameAssembler assembler;
    assert(assembler.phase() == Phase::kEmpty);
    assert(assembler.Submit(frames[order[0]]).status == Status::kStored);
    assert(assembler.phase() == Phase::kCollecting);
    assert(assembler.Submit(frames[order[1]]).status == Status::kStored);
    assert(assembler.Progress().first == 2 && assembler.Progress().second == 3);
    auto outcome = assembler.Submit(frames[order[2]]);
    assert(outcome.status == Status::kSucceeded);
    assert(assembler.phase() == Phase::kSucceeded);
    assert(assembler.seed() != nullptr);
    assert(*assembler.seed() == seed);
  }
}

void TestDuplicatesAndValidatingPhase() {
  auto seed = sp::core::Seed::Generate();
  auto frames = EncodedFrames(seed);
  FrameAssembler assembler;
  assert(assembler.Accept(frames[1]).status == Status::kStored);
  assert(assembler.Accept(frames[1]).status == Status::kDuplicate);
  assert(assembler.ReceivedIndices() == std::vector<uint32_t>{2});
  assert(assembler.Accept(frames[2]).status == Status::kStored);
  assert(assembler.Accept(frames[0]).status == Status::kReadyToValidate);
  assert(assembler.phase() == Phase::kValidating);
  assert(assembler.Accept(frames[0]).status == Status::kIgnored);
  assert(assembler.Validate().status == Status::kSucceeded);
  assert(assembler.Accept(frames[0]).status == Status::kIgnored);
  assert(assembler.Validate().status == Status::kIgnored);
}

void TestDuplicateWithDifferentPayload() {
  auto seed = sp::core::Seed::Generate();
  auto frames = EncodedFrames(seed);
  auto other = EncodedFrames(sp::core::Seed::Generate());
  assert(frames[0] != other[0]);

  FrameAssembler assembler;
  assert(assembler.Accept(frames[0]).status == Status::kStored);
  assert(assembler.Accept(other[0]).status == Status::kDuplicate);
  assert(assembler.ReceivedIndices() == std::vector<uint32_t>{1});
  assert(assembler.Submit(frames[1]).status == Status::kStored);
  assert(assembler.Submit(frames[2]).status == Status::kSucceeded);
  assert(*assembler.seed() == seed);
}

void TestEveryCheckCharacterIsVerified() {
  auto seed = sp::core::Seed::Generate();
  auto frames = EncodedFrames(seed);
  const size_t hex_start = frames[2].size() - 16;
  for (size_t i = 0; i < 16; ++i) {
    std::string tampered = frames[2];
    char& c = tampered[hex_start + i];
    c = c == '0' ? '1' : '0';

    FrameAssembler assembler;
    assert(assembler.Submit(frames[0]).status == Status::kStored);
    assert(assembler.Submit(frames[1]).status == Status::kStored);
    auto outcome = assembler.Submit(tampered);
    assert(outcome.status == Status::kRejected);
    assert(outcome.reason == Reason::kChecksumMismatch);
    assert(assembler.phase() == Phase::kEmpty);
  }
}

void TestDigestFailureResets() {
  auto seed = sp::core::Seed::Generate();
  auto frames = EncodedFrames(seed);
  auto previous = sp::crypto::GetCryptoProviderShared();
  sp::crypto::SetCryptoProvider(std::make_shared<FailingMacProvider>());

  FrameAssembler assembler;
  assert(assembler.Submit(frames[0]).status == Status::kStored);
  assert(assembler.Submit(frames[1]).status == Status::kStored);
  auto outcome = assembler.Submit(frames[2]);
  assert(outcome.status == Status::kRejected);
  assert(outcome.reason == Reason::kInternalError);
  assert(outcome.detail == "hmac backend failure");
  assert(std::strcmp(sp::core::ToString(*outcome.reason), "internal_error") == 0);
  assert(assembler.phase() == Phase::kEmpty);
  assert(assembler.ReceivedIndices().empty());

  sp::crypto::SetCryptoProvider(previous);
  assert(assembler.Submit(frames[0]).status == Status::kStored);
  assert(assembler.Submit(frames[1]).status == Status::kStored);
  assert(assembler.Submit(frames[2]).status == Status::kSucceeded);
  assert(*assembler.seed() == seed);
}

void TestChecksumMismatchResets() {
  auto seed = sp::core::Seed::Generate();
  auto frames = EncodedFrames(seed);
  std::string tampered = frames[2];
  char& last = tampered.back();
  last = last == '0' ? '1' : '0';

  FrameAssembler assembler;
  assert(assembler.Submit(frames[0]).status == Status::kStored);
  assert(assembler.Submit(frames[1]).status == Status::kStored);
  auto outcome = assembler.Submit(tampered);
  assert(outcome.status == Status::kRejected);
  assert(outcome.reason == Reason::kChecksumMismatch);
  assert(std::strcmp(sp::core::ToString(*outcome.reason), "checksum_mismatch") == 0);
  assert(assembler.phase() == Phase::kEmpty);
  assert(assembler.seed() == nullptr);
  assert(assembler.ReceivedIndices().empty());

  // A fresh attempt after the reset succeeds.
  for (const auto& frame : frames) {
    (void)assembler.Submit(frame);
  }
  assert(assembler.phase() == Phase::kSucceeded);
  assert(*assembler.seed() == seed);
}

void TestDecodeErrorResets() {
  auto frames = EncodedFrames(sp::core::Seed::Generate());
  FrameAssembler assembler;
  assert(assembler.Submit("otp-e2ee-seed:1/3:foo bar baz qux foo bar baz qux foo bar baz qux").status ==
         Status::kStored);
  assert(assembler.Submit(frames[1]).status == Status::kStored);
  auto outcome = assembler.Submit(frames[2]);
  assert(outcome.status == Status::kRejected);
  assert(outcome.reason == Reason::kDecodeError);
  assert(assembler.phase() == Phase::kEmpty);
}

void TestMalformedFrameResets() {
  auto frames = EncodedFrames(sp::core::Seed::Generate());
  FrameAssembler assembler;
  assert(assembler.Submit(frames[0]).status == Status::kStored);
  auto outcome = assembler.Submit("not a frame");
  assert(outcome.status == Status::kRejected);
  assert(outcome.reason == Reason::kFormatError);
  assert(!outcome.detail.empty());
  assert(assembler.phase() == Phase::kEmpty);
  assert(assembler.Progress().first == 0);
}

void TestReset() {
  auto frames = EncodedFrames(sp::core::Seed::Generate());
  FrameAssembler assembler;
  (void)assembler.Submit(frames[0]);
  assembler.Reset();
  assert(assembler.phase() == Phase::kEmpty);
  assert(assembler.ReceivedIndices().empty());
}

}  // namespace

int main() {
  TestAnyOrder();
  TestDuplicatesAndValidatingPhase();
  TestDuplicateWithDifferentPayload();
  TestChecksumMismatchResets();
  TestEveryCheckCharacterIsVerified();
  TestDigestFailureResets();
  TestDecodeErrorResets();
  TestMalformedFrameResets();
  TestReset();
  std::cout << "frame assembler tests ok\n";
  return 0;
}

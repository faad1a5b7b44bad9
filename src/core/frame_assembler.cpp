#include "sp/core/frame_assembler.h"

#include "sp/codec/checksum.h"
#include "sp/codec/mnemonic.h"
#include "sp/codec/qr_frame.h"
#include "sp/crypto/ct.h"
#include "sp/error.h"
#include "sp/errors.h"
#include "sp/security/zeroizer.h"

#include <type_traits>
#include <utility>

namespace sp::core {

using sp::security::Zeroizer;

FrameAssembler::~FrameAssembler() {
  Reset();
}

void FrameAssembler::WipePayloads(std::map<uint32_t, std::string>& payloads) noexcept {
  for (auto& entry : payloads) {
    Zeroizer::WipeString(entry.second);
  }
  payloads.clear();
}

void FrameAssembler::Reset() noexcept {
  if (auto* collecting = std::get_if<Collecting>(&state_)) {
    WipePayloads(collecting->payloads);
  } else if (auto* validating = std::get_if<Validating>(&state_)) {
    WipePayloads(validating->payloads);
  }
  state_.emplace<Empty>();
}

FrameAssembler::Outcome FrameAssembler::Reject(RejectReason reason, std::string detail) {
  Reset();
  return Outcome{Status::kRejected, reason, std::move(detail)};
}

FrameAssembler::Outcome FrameAssembler::Accept(std::string_view text) {
  if (std::holds_alternative<Validating>(state_) || std::holds_alternative<Succeeded>(state_)) {
    return Outcome{Status::kIgnored, std::nullopt, {}};
  }

  codec::QrFrame frame;
  try {
    frame = codec::ParseFrame(text);
  } catch (const FormatError& err) {
    return Reject(RejectReason::kFormatError, err.what());
  }

  if (std::holds_alternative<Empty>(state_)) {
    state_.emplace<Collecting>(Collecting{frame.total, {}});
  }
  auto& collecting = std::get<Collecting>(state_);
  if (frame.total != collecting.total) {
    Zeroizer::WipeString(frame.payload);
    return Reject(RejectReason::kFormatError, std::string(errors::msg::kFrameTotal));
  }
  if (collecting.payloads.count(frame.index) != 0) {
    Zeroizer::WipeString(frame.payload);
    return Outcome{Status::kDuplicate, std::nullopt, {}};
  }
  collecting.payloads.emplace(frame.index, std::move(frame.payload));
  if (collecting.payloads.size() < collecting.total) {
    return Outcome{Status::kStored, std::nullopt, {}};
  }

  Validating next{collecting.total, std::move(collecting.payloads)};
  state_.emplace<Validating>(std::move(next));
  return Outcome{Status::kReadyToValidate, std::nullopt, {}};
}

FrameAssembler::Outcome FrameAssembler::Validate() {
  auto* validating = std::get_if<Validating>(&state_);
  if (!validating) {
    return Outcome{Status::kIgnored, std::nullopt, {}};
  }

  std::string sentence;
  for (uint32_t index = 1; index < validating->total; ++index) {
    if (!sentence.empty()) {
      sentence.push_back(' ');
    }
    sentence.append(validating->payloads.at(index));
  }
  const std::string expected_hex(validating->payloads.at(validating->total).substr(codec::kCheckPrefix.size()));

  Seed decoded;
  std::string actual_hex;
  try {
    const auto mnemonic = codec::ParseMnemonicSentence(sentence);
    Zeroizer::WipeString(sentence);
    decoded = codec::DecodeMnemonic(mnemonic);
    actual_hex = codec::ChecksumHex(decoded);
  } catch (const InvalidMnemonicError& err) {
    Zeroizer::WipeString(sentence);
    return Reject(RejectReason::kDecodeError, err.what());
  } catch (const Error& err) {
    // Digest backend failure; the attempt is dropped like any other rejection.
    Zeroizer::WipeString(sentence);
    return Reject(RejectReason::kInternalError, err.what());
  }

  if (!sp::crypto::ct::StringCompare(actual_hex, expected_hex)) {
    return Reject(RejectReason::kChecksumMismatch, std::string(errors::msg::kChecksumMismatch));
  }

  WipePayloads(validating->payloads);
  state_.emplace<Succeeded>(Succeeded{decoded});
  return Outcome{Status::kSucceeded, std::nullopt, {}};
}

FrameAssembler::Outcome FrameAssembler::Submit(std::string_view text) {
  auto outcome = Accept(text);
  if (outcome.status == Status::kReadyToValidate) {
    return Validate();
  }
  return outcome;
}

FrameAssembler::Phase FrameAssembler::phase() const noexcept {
  return std::visit(
      [](const auto& state) {
        using T = std::decay_t<decltype(state)>;
        if constexpr (std::is_same_v<T, Empty>) {
          return Phase::kEmpty;
        } else if constexpr (std::is_same_v<T, Collecting>) {
          return Phase::kCollecting;
        } else if constexpr (std::is_same_v<T, Validating>) {
          return Phase::kValidating;
        } else {
          return Phase::kSucceeded;
        }
      },
      state_);
}

const Seed* FrameAssembler::seed() const noexcept {
  if (const auto* succeeded = std::get_if<Succeeded>(&state_)) {
    return &succeeded->seed;
  }
  return nullptr;
}

std::vector<uint32_t> FrameAssembler::ReceivedIndices() const {
  std::vector<uint32_t> out;
  const std::map<uint32_t, std::string>* payloads = nullptr;
  if (const auto* collecting = std::get_if<Collecting>(&state_)) {
    payloads = &collecting->payloads;
  } else if (const auto* validating = std::get_if<Validating>(&state_)) {
    payloads = &validating->payloads;
  }
  if (payloads) {
    out.reserve(payloads->size());
    for (const auto& entry : *payloads) {
      out.push_back(entry.first);
    }
  }
  return out;
}

std::pair<uint32_t, uint32_t> FrameAssembler::Progress() const noexcept {
  if (const auto* collecting = std::get_if<Collecting>(&state_)) {
    return {static_cast<uint32_t>(collecting->payloads.size()), collecting->total};
  }
  if (const auto* validating = std::get_if<Validating>(&state_)) {
    return {validating->total, validating->total};
  }
  if (std::holds_alternative<Succeeded>(state_)) {
    return {codec::kFrameCount, codec::kFrameCount};
  }
  return {0, 0};
}

const char* ToString(FrameAssembler::RejectReason reason) noexcept {
  switch (reason) {
  case FrameAssembler::RejectReason::kFormatError:
    return "format_error";
  case FrameAssembler::RejectReason::kChecksumMismatch:
    return "checksum_mismatch";
  case FrameAssembler::RejectReason::kDecodeError:
    return "decode_error";
  case FrameAssembler::RejectReason::kInternalError:
    return "internal_error";
  }
  return "format_error";
}

} // namespace sp::core

#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "sp/codec/mnemonic.h"
#include "sp/core/seed.h"

namespace sp::codec {

// Wire form: otp-e2ee-seed:<index>/<total>:<payload>
inline constexpr std::string_view kFramePrefix{"otp-e2ee-seed"};
inline constexpr uint32_t kFrameCount = 3;
inline constexpr size_t kWordsPerFrame = 12;
inline constexpr std::string_view kCheckPrefix{"check:"};
inline constexpr size_t kCheckHexLength = 16;

struct QrFrame {
  uint32_t index{0}; // 1-based
  uint32_t total{0};
  std::string payload;

  bool IsCheckFrame() const noexcept { return index == total && index != 0; }
  // Characters after "check:"; empty for data frames.
  std::string_view CheckHex() const noexcept;
};

// Frame 1 carries words 1-12, frame 2 words 13-24, frame 3 the checksum of
// |seed|. |mnemonic| must be the 24-word encoding of |seed|.
std::array<QrFrame, kFrameCount> SplitIntoFrames(const Mnemonic& mnemonic, const core::Seed& seed);

std::string EncodeFrame(const QrFrame& frame);

// Parses one scanned string. Throws FormatError on any deviation from the
// wire form; never returns a partially filled frame.
QrFrame ParseFrame(std::string_view text);

} // namespace sp::codec

#include "sp/codec/qr_frame.h"

#include "sp/codec/checksum.h"
#include "sp/error.h"
#include "sp/errors.h"

#include <charconv>
#include <string>

namespace sp::codec {
namespace {

// Strict positive decimal: digits only, no sign, no leading zero.
bool ParsePositive(std::string_view text, uint32_t& out) {
  if (text.empty() || text.front() == '0') {
    return false;
  }
  for (char ch : text) {
    if (ch < '0' || ch > '9') {
      return false;
    }
  }
  uint32_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return false;
  }
  out = value;
  return true;
}

[[noreturn]] void Reject(std::string_view message) {
  throw FormatError(std::string(message));
}

void CheckDataPayload(std::string_view payload) {
  size_t words = 0;
  size_t pos = 0;
  while (true) {
    const size_t start = pos;
    while (pos < payload.size() && payload[pos] >= 'a' && payload[pos] <= 'z') {
      ++pos;
    }
    if (pos == start) {
      Reject(errors::msg::kFrameWords);
    }
    ++words;
    if (pos == payload.size()) {
      break;
    }
    if (payload[pos] != ' ') {
      Reject(errors::msg::kFrameWords);
    }
    ++pos;
  }
  if (words != kWordsPerFrame) {
    Reject(errors::msg::kFrameWords);
  }
}

} // namespace

std::string_view QrFrame::CheckHex() const noexcept {
  if (!IsCheckFrame() || payload.size() < kCheckPrefix.size()) {
    return {};
  }
  return std::string_view(payload).substr(kCheckPrefix.size());
}

std::array<QrFrame, kFrameCount> SplitIntoFrames(const Mnemonic& mnemonic, const core::Seed& seed) {
  if (mnemonic.size() != kMnemonicWordCount) {
    throw InvalidMnemonicError(std::string(errors::msg::kMnemonicWordCount));
  }
  std::array<QrFrame, kFrameCount> frames{};
  const auto& words = mnemonic.Words();
  for (uint32_t f = 0; f + 1 < kFrameCount; ++f) {
    std::string payload;
    for (size_t w = 0; w < kWordsPerFrame; ++w) {
      if (w != 0) {
        payload.push_back(' ');
      }
      payload.append(words[f * kWordsPerFrame + w]);
    }
    frames[f] = QrFrame{f + 1, kFrameCount, std::move(payload)};
  }
  frames[kFrameCount - 1] =
      QrFrame{kFrameCount, kFrameCount, std::string(kCheckPrefix) + ChecksumHex(seed)};
  return frames;
}

std::string EncodeFrame(const QrFrame& frame) {
  std::string out(kFramePrefix);
  out.push_back(':');
  out.append(std::to_string(frame.index));
  out.push_back('/');
  out.append(std::to_string(frame.total));
  out.push_back(':');
  out.append(frame.payload);
  return out;
}

QrFrame ParseFrame(std::string_view text) {
  const size_t first = text.find(':');
  if (first == std::string_view::npos) {
    Reject(errors::msg::kFrameSeparator);
  }
  if (text.substr(0, first) != kFramePrefix) {
    Reject(errors::msg::kFramePrefix);
  }
  const size_t second = text.find(':', first + 1);
  if (second == std::string_view::npos) {
    Reject(errors::msg::kFrameSeparator);
  }
  const auto position = text.substr(first + 1, second - first - 1);
  const auto payload = text.substr(second + 1);

  const size_t slash = position.find('/');
  if (slash == std::string_view::npos) {
    Reject(errors::msg::kFrameIndex);
  }
  uint32_t index = 0;
  uint32_t total = 0;
  if (!ParsePositive(position.substr(0, slash), index) ||
      !ParsePositive(position.substr(slash + 1), total)) {
    Reject(errors::msg::kFrameIndex);
  }
  if (total != kFrameCount) {
    Reject(errors::msg::kFrameTotal);
  }
  if (index > total) {
    Reject(errors::msg::kFrameIndex);
  }

  if (index == total) {
    if (payload.substr(0, kCheckPrefix.size()) != kCheckPrefix ||
        payload.size() != kCheckPrefix.size() + kCheckHexLength) {
      Reject(errors::msg::kFrameCheck);
    }
  } else {
    CheckDataPayload(payload);
  }
  return QrFrame{index, total, std::string(payload)};
}

} // namespace sp::codec

#include "sp/codec/mnemonic.h"

#include "sp/crypto/sha256.h"
#include "sp/error.h"
#include "sp/errors.h"
#include "sp/security/zeroizer.h"

#include <algorithm>
#include <cctype>
#include <span>
#include <unordered_map>

namespace sp::codec {
namespace {

using sp::security::Zeroizer;

constexpr size_t kBitsPerWord = 11;
constexpr size_t kPackedBytes = core::kSeedSize + 1; // entropy + checksum byte

const std::unordered_map<std::string_view, uint16_t>& WordIndex() {
  static const std::unordered_map<std::string_view, uint16_t> index = [] {
    std::unordered_map<std::string_view, uint16_t> out;
    const auto& words = EnglishWordlist();
    out.reserve(words.size());
    for (size_t i = 0; i < words.size(); ++i) {
      out.emplace(words[i], static_cast<uint16_t>(i));
    }
    return out;
  }();
  return index;
}

bool IsSpace(char ch) {
  return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

// Packs the 24 indices back into 33 bytes. Returns false for unknown words or
// a wrong count, without touching |packed| beyond zeroing it.
bool PackIndices(const Mnemonic& mnemonic, std::array<uint8_t, kPackedBytes>& packed,
                 std::string_view* failure) {
  packed.fill(0);
  if (mnemonic.size() != kMnemonicWordCount) {
    if (failure) {
      *failure = errors::msg::kMnemonicWordCount;
    }
    return false;
  }
  size_t bit_pos = 0;
  for (const auto& word : mnemonic.Words()) {
    const auto index = MnemonicWordIndex(word);
    if (!index) {
      Zeroizer::Wipe(std::span<uint8_t>(packed.data(), packed.size()));
      if (failure) {
        *failure = errors::msg::kMnemonicUnknownWord;
      }
      return false;
    }
    for (int bit = static_cast<int>(kBitsPerWord) - 1; bit >= 0; --bit) {
      if (((*index >> bit) & 0x01u) != 0) {
        packed[bit_pos / 8] = static_cast<uint8_t>(packed[bit_pos / 8] | (1u << (7 - (bit_pos % 8))));
      }
      ++bit_pos;
    }
  }
  return true;
}

} // namespace

Mnemonic::~Mnemonic() {
  for (auto& word : words_) {
    Zeroizer::WipeString(word);
  }
}

std::string Mnemonic::Sentence() const {
  std::string out;
  for (size_t i = 0; i < words_.size(); ++i) {
    if (i != 0) {
      out.push_back(' ');
    }
    out.append(words_[i]);
  }
  return out;
}

Mnemonic EncodeMnemonic(const core::Seed& seed) {
  std::array<uint8_t, kPackedBytes> packed{};
  const auto bytes = seed.Bytes();
  std::copy(bytes.begin(), bytes.end(), packed.begin());
  auto digest = sp::crypto::SHA256_Hash(std::span<const uint8_t>(bytes.data(), bytes.size()));
  packed[core::kSeedSize] = digest[0];
  Zeroizer::Wipe(std::span<uint8_t>(digest.data(), digest.size()));

  const auto& list = EnglishWordlist();
  std::vector<std::string> words;
  words.reserve(kMnemonicWordCount);
  size_t bit_pos = 0;
  for (size_t w = 0; w < kMnemonicWordCount; ++w) {
    uint16_t index = 0;
    for (size_t bit = 0; bit < kBitsPerWord; ++bit, ++bit_pos) {
      const uint8_t value = static_cast<uint8_t>((packed[bit_pos / 8] >> (7 - (bit_pos % 8))) & 0x01u);
      index = static_cast<uint16_t>((index << 1) | value);
    }
    words.emplace_back(list[index]);
  }
  Zeroizer::Wipe(std::span<uint8_t>(packed.data(), packed.size()));
  return Mnemonic(std::move(words));
}

core::Seed DecodeMnemonic(const Mnemonic& mnemonic) {
  std::array<uint8_t, kPackedBytes> packed{};
  Zeroizer::ScopeWiper<uint8_t> packed_guard(packed.data(), packed.size());
  std::string_view failure;
  if (!PackIndices(mnemonic, packed, &failure)) {
    throw InvalidMnemonicError(std::string(failure));
  }
  const auto entropy = std::span<const uint8_t>(packed.data(), core::kSeedSize);
  auto digest = sp::crypto::SHA256_Hash(entropy);
  const bool checksum_ok = digest[0] == packed[core::kSeedSize];
  Zeroizer::Wipe(std::span<uint8_t>(digest.data(), digest.size()));
  if (!checksum_ok) {
    throw InvalidMnemonicError(std::string(errors::msg::kMnemonicChecksum));
  }
  return core::Seed(entropy.first<core::kSeedSize>());
}

bool ValidateMnemonic(const Mnemonic& mnemonic) noexcept {
  try {
    (void)DecodeMnemonic(mnemonic);
    return true;
  } catch (const InvalidMnemonicError&) {
    return false;
  } catch (const std::exception&) {
    // Hashing failures surface as "not valid"; the caller has no seed either way.
    return false;
  }
}

Mnemonic ParseMnemonicSentence(std::string_view text) {
  std::vector<std::string> words;
  size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && IsSpace(text[pos])) {
      ++pos;
    }
    if (pos >= text.size()) {
      break;
    }
    const size_t start = pos;
    while (pos < text.size() && !IsSpace(text[pos])) {
      ++pos;
    }
    std::string word(text.substr(start, pos - start));
    std::transform(word.begin(), word.end(), word.begin(), [](char ch) {
      return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    });
    words.push_back(std::move(word));
  }
  return Mnemonic(std::move(words));
}

bool IsMnemonicWord(std::string_view word) {
  return MnemonicWordIndex(word).has_value();
}

std::optional<uint16_t> MnemonicWordIndex(std::string_view word) {
  const auto& index = WordIndex();
  auto it = index.find(word);
  if (it == index.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace sp::codec

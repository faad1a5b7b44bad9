#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sp/core/seed.h"

namespace sp::codec {

inline constexpr size_t kWordlistSize = 2048;
inline constexpr size_t kMnemonicWordCount = 24;

// The BIP-39 English wordlist in index order.
const std::array<std::string_view, kWordlistSize>& EnglishWordlist() noexcept;

// A sequence of recovery words. Construction does not validate; use
// ValidateMnemonic or DecodeMnemonic for that. The words are wiped when the
// object goes away.
class Mnemonic {
public:
  Mnemonic() = default;
  explicit Mnemonic(std::vector<std::string> words) : words_(std::move(words)) {}
  Mnemonic(const Mnemonic&) = default;
  Mnemonic& operator=(const Mnemonic&) = default;
  Mnemonic(Mnemonic&&) noexcept = default;
  Mnemonic& operator=(Mnemonic&&) noexcept = default;
  ~Mnemonic();

  const std::vector<std::string>& Words() const noexcept { return words_; }
  size_t size() const noexcept { return words_.size(); }

  // Words joined by single ASCII spaces.
  std::string Sentence() const;

private:
  std::vector<std::string> words_;
};

// 256 bits of seed plus the first SHA-256 byte, cut into 24 11-bit indices.
Mnemonic EncodeMnemonic(const core::Seed& seed);

// Throws InvalidMnemonicError for a wrong word count, a word outside the list
// or a checksum mismatch. No seed is produced unless every check passes.
core::Seed DecodeMnemonic(const Mnemonic& mnemonic);

bool ValidateMnemonic(const Mnemonic& mnemonic) noexcept;

// Splits typed text on whitespace and folds ASCII to lower case. Does not
// check the words.
Mnemonic ParseMnemonicSentence(std::string_view text);

bool IsMnemonicWord(std::string_view word);
std::optional<uint16_t> MnemonicWordIndex(std::string_view word);

} // namespace sp::codec

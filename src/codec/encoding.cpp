#include "sp/codec/encoding.h"

#include "sp/error.h"
#include "sp/security/zeroizer.h"

#include <openssl/evp.h>

#include <algorithm>
#include <limits>

namespace sp::codec {
namespace {

int Nibble(char ch) noexcept {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  return -1;
}

bool IsBase64Char(char ch) noexcept {
  return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') ||
         ch == '+' || ch == '/';
}

} // namespace

std::string HexEncode(std::span<const uint8_t> bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t byte : bytes) {
    out.push_back(kDigits[byte >> 4]);
    out.push_back(kDigits[byte & 0x0F]);
  }
  return out;
}

bool HexDecode(std::string_view text, std::span<uint8_t> out) noexcept {
  if (text.size() != out.size() * 2) {
    return false;
  }
  for (size_t i = 0; i < out.size(); ++i) {
    const int high = Nibble(text[i * 2]);
    const int low = Nibble(text[i * 2 + 1]);
    if (high < 0 || low < 0) {
      sp::security::Zeroizer::Wipe(out);
      return false;
    }
    out[i] = static_cast<uint8_t>((high << 4) | low);
  }
  return true;
}

std::string Base64Encode(std::span<const uint8_t> bytes) {
  if (bytes.empty()) {
    return {};
  }
  if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max() / 4 * 3)) {
    throw Error(ErrorDomain::Validation, errors::validation::kInvalidEncoding,
                "Input too large for base64 encoding");
  }
  std::string out(((bytes.size() + 2) / 3) * 4 + 1, '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(),
                                      static_cast<int>(bytes.size()));
  out.resize(static_cast<size_t>(written));
  return out;
}

std::optional<std::vector<uint8_t>> Base64Decode(std::string_view text) {
  if (text.empty()) {
    return std::vector<uint8_t>{};
  }
  if (text.size() % 4 != 0 ||
      text.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }
  size_t padding = 0;
  if (text.back() == '=') {
    ++padding;
    if (text[text.size() - 2] == '=') {
      ++padding;
    }
  }
  const size_t body = text.size() - padding;
  for (size_t i = 0; i < body; ++i) {
    if (!IsBase64Char(text[i])) {
      return std::nullopt;
    }
  }
  // EVP_DecodeBlock keeps the zero bytes produced by '=' in its output.
  std::vector<uint8_t> out(text.size() / 4 * 3);
  const int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                      static_cast<int>(text.size()));
  if (written < 0 || static_cast<size_t>(written) != out.size()) {
    sp::security::Zeroizer::WipeVector(out);
    return std::nullopt;
  }
  out.resize(out.size() - padding);
  return out;
}

} // namespace sp::codec

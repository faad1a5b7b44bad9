#include "sp/core/seed.h"

#include "sp/codec/encoding.h"
#include "sp/crypto/ct.h"
#include "sp/crypto/random.h"
#include "sp/error.h"
#include "sp/errors.h"
#include "sp/security/zeroizer.h"

#include <algorithm>
#include <string>

namespace sp::core {

Seed::Seed(std::span<const uint8_t, kSeedSize> bytes) noexcept {
  std::copy(bytes.begin(), bytes.end(), bytes_.begin());
}

Seed::Seed(const Seed& other) noexcept : bytes_(other.bytes_) {}

Seed& Seed::operator=(const Seed& other) noexcept {
  if (this != &other) {
    bytes_ = other.bytes_;
  }
  return *this;
}

Seed::Seed(Seed&& other) noexcept : bytes_(other.bytes_) {
  other.Wipe();
}

Seed& Seed::operator=(Seed&& other) noexcept {
  if (this != &other) {
    bytes_ = other.bytes_;
    other.Wipe();
  }
  return *this;
}

Seed::~Seed() {
  Wipe();
}

void Seed::Wipe() noexcept {
  sp::security::Zeroizer::Wipe(std::span<uint8_t>(bytes_.data(), bytes_.size()));
}

Seed Seed::FromBytes(std::span<const uint8_t> bytes) {
  if (bytes.size() != kSeedSize) {
    throw FormatError("Seed must be exactly 32 bytes, got " + std::to_string(bytes.size()),
                      errors::validation::kMalformedIdentity);
  }
  return Seed(bytes.first<kSeedSize>());
}

Seed Seed::Generate() {
  Seed seed;
  sp::crypto::SystemRandomBytes(std::span<uint8_t>(seed.bytes_.data(), seed.bytes_.size()));
  return seed;
}

Seed Seed::FromHex(std::string_view hex) {
  Seed seed;
  if (!sp::codec::HexDecode(hex, std::span<uint8_t>(seed.bytes_.data(), seed.bytes_.size()))) {
    throw FormatError(std::string(errors::msg::kIdentityCorrupt),
                      errors::validation::kMalformedIdentity);
  }
  return seed;
}

std::string Seed::ToHex() const {
  return sp::codec::HexEncode(std::span<const uint8_t>(bytes_.data(), bytes_.size()));
}

bool Seed::operator==(const Seed& other) const noexcept {
  return sp::crypto::ct::CompareEqual(bytes_, other.bytes_);
}

} // namespace sp::core

#include "sp/codec/checksum.h"

#include "sp/codec/encoding.h"
#include "sp/crypto/hmac_sha256.h"
#include "sp/security/zeroizer.h"

#include <algorithm>
#include <span>

namespace sp::codec {

std::array<uint8_t, kChecksumSize> ComputeChecksum(const core::Seed& seed) {
  const auto bytes = seed.Bytes();
  const std::span<const uint8_t> view(bytes.data(), bytes.size());
  auto mac = sp::crypto::HMAC_SHA256::Compute(view, view);
  std::array<uint8_t, kChecksumSize> out{};
  std::copy_n(mac.begin(), out.size(), out.begin());
  sp::security::Zeroizer::Wipe(std::span<uint8_t>(mac.data(), mac.size()));
  return out;
}

std::string ChecksumHex(const core::Seed& seed) {
  const auto tag = ComputeChecksum(seed);
  return HexEncode(std::span<const uint8_t>(tag.data(), tag.size()));
}

} // namespace sp::codec

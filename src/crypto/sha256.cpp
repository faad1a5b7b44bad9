#include "sp/crypto/sha256.h"

#include "sp/common.h"
#include "sp/crypto/provider.h"

namespace sp::crypto {

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data) {
  auto provider = GetCryptoProviderShared();
  return provider->SHA256(data);
}

std::array<uint8_t, 32> SHA256_Hash(std::string_view text) {
  return SHA256_Hash(sp::TextBytes(text));
}

}  // namespace sp::crypto

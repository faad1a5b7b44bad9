#include "sp/crypto/aes_gcm.h"

#include "sp/crypto/provider.h"
#include "sp/error.h"
#include "sp/security/secure_buffer.h"
#include "sp/security/zeroizer.h"

namespace sp::crypto {

AES256_GCM::EncryptionResult AES256_GCM_Encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) {
  auto provider = GetCryptoProviderShared();
  return provider->EncryptAES256GCM(plaintext, aad, nonce, key);
}

void AES256_GCM_Decrypt_Secure(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
    sp::security::SecureBuffer<uint8_t>& dest_buffer) {
  if (dest_buffer.size() != ciphertext.size()) {
    throw sp::Error{sp::ErrorDomain::Internal, 0,
                    "Secure decrypt buffer does not match ciphertext length"};
  }
  auto provider = GetCryptoProviderShared();
  size_t decrypted_size = 0;
  try {
    decrypted_size = provider->DecryptAES256GCM(ciphertext, aad, nonce, tag, key,
                                                dest_buffer.AsSpan());
  } catch (const sp::AuthenticationFailureError&) {
    // Unauthenticated plaintext never leaves this function.
    sp::security::Zeroizer::Wipe(dest_buffer.AsSpan());
    throw;
  }

  if (decrypted_size != dest_buffer.size()) {
    sp::security::Zeroizer::Wipe(dest_buffer.AsSpan());
    throw sp::Error{sp::ErrorDomain::Validation, 0,
                    "Decrypted size mismatch in secure decrypt"};
  }
}

} // namespace sp::crypto

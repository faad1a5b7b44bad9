#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace sp::security { template<typename T> class SecureBuffer; }

namespace sp::crypto {

struct AES256_GCM {
  static constexpr size_t KEY_SIZE = 32;
  static constexpr size_t NONCE_SIZE = 12;
  static constexpr size_t TAG_SIZE = 16;

  struct EncryptionResult {
    std::vector<uint8_t> ciphertext;
    std::array<uint8_t, TAG_SIZE> tag;
  };
};

// Encrypts |plaintext| using AES-256-GCM. Throws sp::Error on provider failures.
AES256_GCM::EncryptionResult AES256_GCM_Encrypt(std::span<const uint8_t> plaintext,
                                               std::span<const uint8_t> aad,
                                               std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
                                               std::span<const uint8_t, AES256_GCM::KEY_SIZE> key);

// Decrypts |ciphertext| directly into |dest_buffer|, which must be exactly the
// ciphertext length. Throws AuthenticationFailureError on tag mismatch and
// sp::Error on other provider failures. Nothing is released to the caller
// unless the tag verifies.
void AES256_GCM_Decrypt_Secure(std::span<const uint8_t> ciphertext,
                               std::span<const uint8_t> aad,
                               std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
                               std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
                               std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
                               sp::security::SecureBuffer<uint8_t>& dest_buffer);

} // namespace sp::crypto

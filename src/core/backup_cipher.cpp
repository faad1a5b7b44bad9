#include "sp/core/backup_cipher.h"

#include "sp/codec/encoding.h"
#include "sp/common.h"
#include "sp/crypto/aes_gcm.h"
#include "sp/crypto/random.h"
#include "sp/error.h"
#include "sp/errors.h"
#include "sp/security/secure_buffer.h"
#include "sp/security/zeroizer.h"

#include <algorithm>
#include <array>
#include <optional>
#include <span>
#include <string>

namespace sp::core {
namespace {

using sp::crypto::AES256_GCM;
using sp::security::SecureBuffer;
using sp::security::Zeroizer;

constexpr size_t kBlobSize = AES256_GCM::NONCE_SIZE + kSeedSize + AES256_GCM::TAG_SIZE;

static_assert(kBackupKeyLength == AES256_GCM::KEY_SIZE);
static_assert(kBackupNonceLength == AES256_GCM::NONCE_SIZE);
static_assert(kBackupMacLength == AES256_GCM::TAG_SIZE);

// Parameters a record may carry. libargon2 itself needs 8 KiB per lane.
bool StoredParamsAcceptable(const Argon2Params& params) noexcept {
  if (params.hash_length != kBackupKeyLength || params.nonce_length != kBackupNonceLength ||
      params.mac_length != kBackupMacLength) {
    return false;
  }
  if (params.salt.size() < kMinStoredSaltSize || params.salt.size() > kMaxStoredSaltSize) {
    return false;
  }
  if (params.iterations == 0 || params.iterations > kMaxArgon2Iterations) {
    return false;
  }
  if (params.parallelism == 0 || params.parallelism > kMaxArgon2Parallelism) {
    return false;
  }
  if (params.memory_kib < 8u * params.parallelism || params.memory_kib > kMaxArgon2MemoryKiB) {
    return false;
  }
  return true;
}

} // namespace

PassphraseBackupCipher::PassphraseBackupCipher(crypto::Argon2idCost cost) : cost_(cost) {
  if (cost_.memory_cost_kib < kMinArgon2MemoryKiB || cost_.time_cost < kMinArgon2Iterations ||
      cost_.parallelism == 0) {
    throw Error(ErrorDomain::Config, errors::config::kBelowSecurityFloor,
                std::string(errors::msg::kArgon2BelowFloor));
  }
  if (cost_.memory_cost_kib > kMaxArgon2MemoryKiB || cost_.time_cost > kMaxArgon2Iterations ||
      cost_.parallelism > kMaxArgon2Parallelism) {
    // A backup written with these could never be restored.
    throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                "Argon2id parameters exceed the supported maximum");
  }
}

EncryptedBackup PassphraseBackupCipher::Encrypt(const Seed& seed, std::string_view passphrase) const {
  EncryptedBackup backup;
  backup.params.salt.resize(kBackupSaltSize);
  backup.params.iterations = cost_.time_cost;
  backup.params.memory_kib = cost_.memory_cost_kib;
  backup.params.parallelism = cost_.parallelism;
  crypto::SystemRandomBytes(backup.params.salt);

  std::array<uint8_t, AES256_GCM::NONCE_SIZE> nonce{};
  crypto::SystemRandomBytes(nonce);

  SecureBuffer<uint8_t> key(AES256_GCM::KEY_SIZE);
  crypto::DeriveArgon2id(TextBytes(passphrase), backup.params.salt, cost_, key.AsSpan());

  const auto plaintext = seed.Bytes();
  auto sealed = crypto::AES256_GCM_Encrypt(
      std::span<const uint8_t>(plaintext.data(), plaintext.size()), {},
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE>(nonce),
      std::span<const uint8_t, AES256_GCM::KEY_SIZE>(key.data(), AES256_GCM::KEY_SIZE));

  std::vector<uint8_t> blob;
  blob.reserve(kBlobSize);
  blob.insert(blob.end(), nonce.begin(), nonce.end());
  blob.insert(blob.end(), sealed.ciphertext.begin(), sealed.ciphertext.end());
  blob.insert(blob.end(), sealed.tag.begin(), sealed.tag.end());
  backup.ciphertext = codec::Base64Encode(blob);
  return backup;
}

Seed PassphraseBackupCipher::Decrypt(const EncryptedBackup& backup, std::string_view passphrase) const {
  if (!StoredParamsAcceptable(backup.params)) {
    throw DecryptionFailedError();
  }
  const auto blob = codec::Base64Decode(backup.ciphertext);
  if (!blob || blob->size() != kBlobSize) {
    throw DecryptionFailedError();
  }
  const std::span<const uint8_t> view(*blob);
  const auto nonce = view.first<AES256_GCM::NONCE_SIZE>();
  const auto ciphertext = view.subspan(AES256_GCM::NONCE_SIZE, kSeedSize);
  const auto tag = view.last<AES256_GCM::TAG_SIZE>();

  SecureBuffer<uint8_t> key(AES256_GCM::KEY_SIZE);
  crypto::DeriveArgon2id(TextBytes(passphrase), backup.params.salt, backup.params.Cost(),
                         key.AsSpan());

  SecureBuffer<uint8_t> plaintext(kSeedSize);
  try {
    crypto::AES256_GCM_Decrypt_Secure(
        ciphertext, {}, nonce, tag,
        std::span<const uint8_t, AES256_GCM::KEY_SIZE>(key.data(), AES256_GCM::KEY_SIZE), plaintext);
  } catch (const AuthenticationFailureError&) {
    throw DecryptionFailedError();
  }
  return Seed(std::span<const uint8_t, kSeedSize>(plaintext.data(), kSeedSize));
}

} // namespace sp::core

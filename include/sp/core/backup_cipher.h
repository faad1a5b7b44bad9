#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "sp/core/seed.h"
#include "sp/crypto/argon2id.h"

namespace sp::core {

inline constexpr size_t kBackupSaltSize = 16;
inline constexpr uint32_t kBackupKeyLength = 32;
inline constexpr uint32_t kBackupNonceLength = 12;
inline constexpr uint32_t kBackupMacLength = 16;

// Floors for newly created backups.
inline constexpr uint32_t kMinArgon2Iterations = 2;
inline constexpr uint32_t kMinArgon2MemoryKiB = 64 * 1024;

// Ceilings for stored parameters; anything above is treated as a damaged
// record rather than run.
inline constexpr uint32_t kMaxArgon2Iterations = 64;
inline constexpr uint32_t kMaxArgon2MemoryKiB = 1024 * 1024;
inline constexpr uint32_t kMaxArgon2Parallelism = 16;
inline constexpr size_t kMinStoredSaltSize = 8;
inline constexpr size_t kMaxStoredSaltSize = 64;

struct Argon2Params {
  std::vector<uint8_t> salt;
  uint32_t iterations{kMinArgon2Iterations};
  uint32_t memory_kib{kMinArgon2MemoryKiB};
  uint32_t parallelism{1};
  uint32_t hash_length{kBackupKeyLength};
  uint32_t nonce_length{kBackupNonceLength};
  uint32_t mac_length{kBackupMacLength};

  crypto::Argon2idCost Cost() const noexcept {
    return crypto::Argon2idCost{iterations, memory_kib, parallelism};
  }
};

struct EncryptedBackup {
  Argon2Params params;
  std::string ciphertext; // base64(nonce || ciphertext || tag)
};

// Seals a seed under a passphrase with Argon2id and AES-256-GCM. Holds only
// the cost settings for new backups; every call draws a fresh salt and nonce.
class PassphraseBackupCipher {
public:
  // Throws sp::Error (Config, kBelowSecurityFloor) when |cost| is weaker
  // than 64 MiB / 2 iterations or has zero lanes.
  explicit PassphraseBackupCipher(crypto::Argon2idCost cost = {});

  EncryptedBackup Encrypt(const Seed& seed, std::string_view passphrase) const;

  // Uses the parameters stored in |backup|. Every failure in the record or
  // the tag raises DecryptionFailedError with the same message.
  Seed Decrypt(const EncryptedBackup& backup, std::string_view passphrase) const;

  const crypto::Argon2idCost& cost() const noexcept { return cost_; }

private:
  crypto::Argon2idCost cost_;
};

} // namespace sp::core

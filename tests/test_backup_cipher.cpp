#include "sp/codec/encoding.h"
#include "sp/core/backup_cipher.h"
#include "sp/core/seed.h"
#include "sp/error.h"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using sp::core::EncryptedBackup;
using sp::core::PassphraseBackupCipher;

constexpr const char* kPassphrase = "correct horse battery staple";

bool DecryptFails(const PassphraseBackupCipher& cipher, const EncryptedBackup& backup,
                  const std::string& passphrase) {
  try {
    (void)cipher.Decrypt(backup, passphrase);
  } catch (const sp::DecryptionFailedError& err) {
    assert(err.retryability == sp::Retryability::kRetryable);
    return true;
  }
  return false;
}

void TestRoundTripAndFreshness(const PassphraseBackupCipher& cipher) {
  auto seed = sp::core::Seed::Generate();
  auto first = cipher.Encrypt(seed, kPassphrase);
  auto second = cipher.Encrypt(seed, kPassphrase);

  assert(first.params.salt.size() == sp::core::kBackupSaltSize);
  assert(first.params.iterations == sp::core::kMinArgon2Iterations);
  assert(first.params.memory_kib == sp::core::kMinArgon2MemoryKiB);
  assert(first.params.hash_length == 32);
  assert(first.params.nonce_length == 12);
  assert(first.params.mac_length == 16);

  // 12 nonce + 32 ciphertext + 16 tag = 60 bytes of base64.
  auto blob = sp::codec::Base64Decode(first.ciphertext);
  assert(blob && blob->size() == 60);

  assert(first.params.salt != second.params.salt);
  assert(first.ciphertext != second.ciphertext);

  assert(cipher.Decrypt(first, kPassphrase) == seed);
  assert(cipher.Decrypt(second, kPassphrase) == seed);
}

void TestWrongPassphrase(const PassphraseBackupCipher& cipher) {
  auto backup = cipher.Encrypt(sp::core::Seed::Generate(), kPassphrase);
  assert(DecryptFails(cipher, backup, "correct horse battery stapler"));
  assert(DecryptFails(cipher, backup, ""));
}

void TestTamperedBlob(const PassphraseBackupCipher& cipher) {
  auto backup = cipher.Encrypt(sp::core::Seed::Generate(), kPassphrase);
  auto blob = sp::codec::Base64Decode(backup.ciphertext).value();
  blob[20] ^= 0x01;
  auto tampered = backup;
  tampered.ciphertext = sp::codec::Base64Encode(blob);
  assert(DecryptFails(cipher, tampered, kPassphrase));

  auto truncated = backup;
  truncated.ciphertext = backup.ciphertext.substr(0, backup.ciphertext.size() - 4);
  assert(DecryptFails(cipher, truncated, kPassphrase));

  auto garbage = backup;
  garbage.ciphertext = "!!!!";
  assert(DecryptFails(cipher, garbage, kPassphrase));

  auto other_salt = backup;
  other_salt.params.salt[0] ^= 0xff;
  assert(DecryptFails(cipher, other_salt, kPassphrase));
}

void TestHostileParameters(const PassphraseBackupCipher& cipher) {
  auto backup = cipher.Encrypt(sp::core::Seed::Generate(), kPassphrase);

  auto huge_memory = backup;
  huge_memory.params.memory_kib = 0xFFFFFFFFu;
  assert(DecryptFails(cipher, huge_memory, kPassphrase));

  auto wrong_hash = backup;
  wrong_hash.params.hash_length = 16;
  assert(DecryptFails(cipher, wrong_hash, kPassphrase));

  auto no_lanes = backup;
  no_lanes.params.parallelism = 0;
  assert(DecryptFails(cipher, no_lanes, kPassphrase));

  auto empty_salt = backup;
  empty_salt.params.salt.clear();
  assert(DecryptFails(cipher, empty_salt, kPassphrase));
}

void TestStoredParametersWin() {
  // A record written with a stronger cost still opens under the default cipher.
  PassphraseBackupCipher strong({3, sp::core::kMinArgon2MemoryKiB, 1});
  PassphraseBackupCipher standard;
  auto seed = sp::core::Seed::Generate();
  auto backup = strong.Encrypt(seed, kPassphrase);
  assert(backup.params.iterations == 3);
  assert(standard.Decrypt(backup, kPassphrase) == seed);
}

void TestFloors() {
  bool threw = false;
  try {
    PassphraseBackupCipher weak({1, sp::core::kMinArgon2MemoryKiB, 1});
  } catch (const sp::Error& err) {
    threw = err.domain == sp::ErrorDomain::Config &&
            err.code == sp::errors::config::kBelowSecurityFloor;
  }
  assert(threw && "one iteration must be rejected");

  threw = false;
  try {
    PassphraseBackupCipher weak({2, 32 * 1024, 1});
  } catch (const sp::Error& err) {
    threw = err.code == sp::errors::config::kBelowSecurityFloor;
  }
  assert(threw && "32 MiB must be rejected");

  threw = false;
  try {
    PassphraseBackupCipher excessive({2, sp::core::kMaxArgon2MemoryKiB + 1, 1});
  } catch (const sp::Error& err) {
    threw = err.code == sp::errors::config::kInvalidValue;
  }
  assert(threw && "memory above the ceiling must be rejected");
}

}  // namespace

int main() {
  PassphraseBackupCipher cipher;
  TestRoundTripAndFreshness(cipher);
  TestWrongPassphrase(cipher);
  TestTamperedBlob(cipher);
  TestHostileParameters(cipher);
  TestStoredParametersWin();
  TestFloors();
  std::cout << "backup cipher tests ok\n";
  return 0;
}

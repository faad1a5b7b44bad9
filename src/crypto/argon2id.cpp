#include "sp/crypto/argon2id.h"

#include <argon2.h>

#include <string>

#include "sp/error.h"
#include "sp/errors.h"
#include "sp/security/zeroizer.h"

namespace sp::crypto {

void DeriveArgon2id(std::span<const uint8_t> password,
                    std::span<const uint8_t> salt,
                    const Argon2idCost& cost,
                    std::span<uint8_t> out) {
  if (out.empty()) {
    throw sp::Error{sp::ErrorDomain::Crypto, sp::errors::crypto::kUnsupportedArgon2Parameters,
                    std::string(sp::errors::msg::kUnsupportedArgon2HashLength)};
  }
  const int rc = argon2id_hash_raw(cost.time_cost, cost.memory_cost_kib, cost.parallelism,
                                   password.data(), password.size(), salt.data(), salt.size(),
                                   out.data(), out.size());
  if (rc != ARGON2_OK) {
    sp::security::Zeroizer::Wipe(out);
    throw sp::Error{sp::ErrorDomain::Crypto, sp::errors::crypto::kArgon2DerivationFailed,
                    std::string(sp::errors::msg::kArgon2DerivationFailed) + ": " +
                        argon2_error_message(rc),
                    rc};
  }
}

} // namespace sp::crypto

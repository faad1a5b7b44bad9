#pragma once
#include <cstdint>
#include <span>

namespace sp::crypto {

struct Argon2idCost {
  uint32_t time_cost{2};            // iterations
  uint32_t memory_cost_kib{65536};  // 64 MiB
  uint32_t parallelism{1};          // lanes
};

// Derives |out.size()| bytes from |password| and |salt| with Argon2id v1.3.
// Throws sp::Error (Crypto) when libargon2 rejects the parameters or fails.
void DeriveArgon2id(std::span<const uint8_t> password,
                    std::span<const uint8_t> salt,
                    const Argon2idCost& cost,
                    std::span<uint8_t> out);

} // namespace sp::crypto

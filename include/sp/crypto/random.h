#pragma once

#include <cstdint>
#include <span>

namespace sp::crypto {

// Fills |out| from the operating system CSPRNG. Throws sp::Error when no
// entropy source is available.
void SystemRandomBytes(std::span<uint8_t> out);

}  // namespace sp::crypto

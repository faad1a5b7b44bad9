#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include "sp/core/seed.h"

namespace sp::codec {

inline constexpr size_t kChecksumSize = 8;

// HMAC-SHA256(key = seed, msg = seed) truncated to kChecksumSize bytes.
//
// The tag is keyed by the value it protects, so anyone holding the frames can
// recompute it. It catches transcription and scan corruption only. It does
// not authenticate the sender and gives no protection against someone who
// controls the displayed QR codes.
std::array<uint8_t, kChecksumSize> ComputeChecksum(const core::Seed& seed);

// 16 lowercase hex characters of ComputeChecksum.
std::string ChecksumHex(const core::Seed& seed);

} // namespace sp::codec

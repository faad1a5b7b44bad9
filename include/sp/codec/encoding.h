#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sp::codec {

// Lowercase hex.
std::string HexEncode(std::span<const uint8_t> bytes);

// Accepts either case. Returns false unless |text| is exactly
// 2 * out.size() hex digits; |out| is left zeroed on failure.
bool HexDecode(std::string_view text, std::span<uint8_t> out) noexcept;

// RFC 4648 base64 with padding.
std::string Base64Encode(std::span<const uint8_t> bytes);

// Strict decode: padded, no whitespace, standard alphabet only.
std::optional<std::vector<uint8_t>> Base64Decode(std::string_view text);

} // namespace sp::codec

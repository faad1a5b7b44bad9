#pragma once
#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>

namespace sp::crypto::ct {

template <size_t N>
inline bool CompareEqual(const std::array<uint8_t, N>& a,
                         const std::array<uint8_t, N>& b) noexcept {
  volatile uint8_t diff = 0;
  for (size_t i = 0; i < N; ++i)
    diff |= (a[i] ^ b[i]);
  return diff == 0;
}

// Length is treated as public; only the contents are compared in constant time.
inline bool CompareEqual(std::span<const uint8_t> a, std::span<const uint8_t> b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  volatile uint8_t diff = 0;
  for (size_t i = 0; i < a.size(); ++i)
    diff |= (a[i] ^ b[i]);
  std::atomic_signal_fence(std::memory_order_seq_cst);
  return diff == 0;
}

// Inputs longer than kMaxLen never compare equal.
inline bool StringCompare(std::string_view a, std::string_view b) noexcept {
  constexpr size_t kMaxLen = 256;
  std::array<uint8_t, kMaxLen> padded_a{};
  std::array<uint8_t, kMaxLen> padded_b{};

  const size_t copy_a = std::min(a.size(), kMaxLen);
  const size_t copy_b = std::min(b.size(), kMaxLen);

  std::memcpy(padded_a.data(), a.data(), copy_a);
  std::memcpy(padded_b.data(), b.data(), copy_b);

  volatile uint8_t diff = 0;
  diff |= static_cast<uint8_t>((copy_a ^ copy_b) != 0);
  diff |= static_cast<uint8_t>((a.size() > kMaxLen) | (b.size() > kMaxLen));
  for (size_t i = 0; i < kMaxLen; ++i) {
    diff |= static_cast<uint8_t>(padded_a[i] ^ padded_b[i]);
  }
  std::atomic_signal_fence(std::memory_order_seq_cst);
  return diff == 0;
}

} // namespace sp::crypto::ct

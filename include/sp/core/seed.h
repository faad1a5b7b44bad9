#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace sp::core {

inline constexpr size_t kSeedSize = 32;

// The root identity secret. Bytes are wiped when the value is destroyed or
// overwritten; nothing here ever writes them to a log.
class Seed {
public:
  Seed() noexcept = default;
  explicit Seed(std::span<const uint8_t, kSeedSize> bytes) noexcept;
  Seed(const Seed& other) noexcept;
  Seed& operator=(const Seed& other) noexcept;
  Seed(Seed&& other) noexcept;
  Seed& operator=(Seed&& other) noexcept;
  ~Seed();

  // Throws FormatError unless |bytes| is exactly kSeedSize long.
  static Seed FromBytes(std::span<const uint8_t> bytes);
  // Fresh seed from the OS CSPRNG.
  static Seed Generate();
  // 64 hex characters, either case. Throws FormatError (kMalformedIdentity).
  static Seed FromHex(std::string_view hex);

  std::string ToHex() const;
  std::span<const uint8_t, kSeedSize> Bytes() const noexcept { return bytes_; }

  // Constant time.
  bool operator==(const Seed& other) const noexcept;
  bool operator!=(const Seed& other) const noexcept { return !(*this == other); }

private:
  void Wipe() noexcept;

  std::array<uint8_t, kSeedSize> bytes_{};
};

} // namespace sp::core

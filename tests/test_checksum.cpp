#include "sp/codec/checksum.h"
#include "sp/codec/encoding.h"
#include "sp/core/seed.h"
#include "sp/error.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>

namespace {

sp::core::Seed FilledSeed(uint8_t value) {
  std::array<uint8_t, sp::core::kSeedSize> bytes{};
  bytes.fill(value);
  return sp::core::Seed(bytes);
}

void TestChecksumVectors() {
  assert(sp::codec::ChecksumHex(FilledSeed(0x00)) == "33ad0a1c607ec03b");
  assert(sp::codec::ChecksumHex(FilledSeed(0x7f)) == "db10ca2db18e5da3");
  assert(sp::codec::ChecksumHex(FilledSeed(0xff)) == "8a5183c87dc4e694");

  auto raw = sp::codec::ComputeChecksum(FilledSeed(0x00));
  assert(raw[0] == 0x33 && raw[7] == 0x3b);
  assert(sp::codec::HexEncode(raw) == sp::codec::ChecksumHex(FilledSeed(0x00)));
}

void TestSeedHex() {
  auto seed = sp::core::Seed::Generate();
  auto hex = seed.ToHex();
  assert(hex.size() == 64);
  assert(sp::core::Seed::FromHex(hex) == seed);

  std::string upper = hex;
  for (auto& ch : upper) {
    if (ch >= 'a' && ch <= 'f') {
      ch = static_cast<char>(ch - 'a' + 'A');
    }
  }
  assert(sp::core::Seed::FromHex(upper) == seed);

  bool threw = false;
  try {
    (void)sp::core::Seed::FromHex(hex.substr(0, 62));
  } catch (const sp::FormatError&) {
    threw = true;
  }
  assert(threw && "short hex must be rejected");

  threw = false;
  try {
    (void)sp::core::Seed::FromHex(std::string(63, 'a') + "g");
  } catch (const sp::FormatError&) {
    threw = true;
  }
  assert(threw && "non-hex digit must be rejected");
}

void TestBase64() {
  const std::array<uint8_t, 5> data{'h', 'e', 'l', 'l', 'o'};
  assert(sp::codec::Base64Encode(data) == "aGVsbG8=");
  auto decoded = sp::codec::Base64Decode("aGVsbG8=");
  assert(decoded && decoded->size() == 5 && (*decoded)[4] == 'o');
  assert(!sp::codec::Base64Decode("aGVsbG8").has_value());
  assert(!sp::codec::Base64Decode("aGVs*G8=").has_value());
  assert(sp::codec::Base64Decode("")->empty());
}

}  // namespace

int main() {
  TestChecksumVectors();
  TestSeedHex();
  TestBase64();
  std::cout << "checksum tests ok\n";
  return 0;
}

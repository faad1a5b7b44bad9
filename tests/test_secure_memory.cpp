#include "sp/core/seed.h"
#include "sp/platform/memory_lock.h"
#include "sp/security/secure_buffer.h"
#include "sp/security/zeroizer.h"

#include <algorithm>
#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <span>
#include <string>
#include <vector>

namespace {

using sp::security::SecureBuffer;
using sp::security::Zeroizer;

bool AllZero(std::span<const uint8_t> bytes) {
  return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

void TestWipe() {
  std::array<uint8_t, 32> raw{};
  raw.fill(0xAA);
  Zeroizer::Wipe(raw);
  assert(AllZero(raw));

  std::string text = "abandon ability able";
  Zeroizer::WipeString(text);
  assert(std::all_of(text.begin(), text.end(), [](char c) { return c == '\0'; }));

  std::vector<uint32_t> words(4, 0xFFFFFFFFu);
  Zeroizer::WipeVector(words);
  assert(std::all_of(words.begin(), words.end(), [](uint32_t w) { return w == 0; }));

  std::array<uint8_t, 8> scoped{};
  scoped.fill(0x55);
  {
    Zeroizer::ScopeWiper<uint8_t> wiper(scoped.data(), scoped.size());
  }
  assert(AllZero(scoped));
}

void TestSecureBuffer() {
  SecureBuffer<uint8_t> buffer(32);
  assert(buffer.size() == 32);
  assert(AllZero(buffer.AsSpan()));
  std::fill(buffer.data(), buffer.data() + buffer.size(), 0x42);

  SecureBuffer<uint8_t> moved(std::move(buffer));
  assert(moved.size() == 32 && moved.data()[0] == 0x42);
  assert(buffer.empty());

  const std::array<uint8_t, 3> source{1, 2, 3};
  auto copy = SecureBuffer<uint8_t>::CopyOf(source);
  assert(copy.size() == 3 && copy.data()[2] == 3);

  SecureBuffer<uint8_t> empty(0);
  assert(empty.empty());
}

void TestSeedMoveWipesSource() {
  std::array<uint8_t, sp::core::kSeedSize> bytes{};
  bytes.fill(0x7f);
  sp::core::Seed original(bytes);
  sp::core::Seed copy = original;
  sp::core::Seed moved = std::move(original);
  assert(moved == copy);
  assert(AllZero(original.Bytes()));
}

void TestMemoryLock() {
  std::array<std::uint8_t, 64> buffer{};
  auto status = sp::platform::LockMemory(buffer.data(), buffer.size());
  if (status == sp::platform::MemoryLockStatus::kUnsupported) {
    return;
  }
  assert(status == sp::platform::MemoryLockStatus::kLocked ||
         status == sp::platform::MemoryLockStatus::kBestEffort);
  sp::platform::UnlockMemory(buffer.data(), buffer.size());
}

}  // namespace

int main() {
  TestWipe();
  TestSecureBuffer();
  TestSeedMoveWipesSource();
  TestMemoryLock();
  std::cout << "secure memory tests ok\n";
  return 0;
}

#pragma once

#include <cstddef>
#include <cstdint>

namespace sp::platform {

enum class MemoryLockStatus {
  kLocked,
  kBestEffort,
  kUnsupported,
};

MemoryLockStatus LockMemory(void* ptr, std::size_t length) noexcept;
void UnlockMemory(void* ptr, std::size_t length) noexcept;
bool MemoryLockSupported() noexcept;

}  // namespace sp::platform

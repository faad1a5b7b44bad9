#include "sp/platform/memory_lock.h"

#include <cerrno>

#if defined(_WIN32)
#define NOMINMAX
#include <windows.h>
#elif defined(__unix__) || defined(__APPLE__)
#include <sys/mman.h>
#include <unistd.h>
#endif

namespace sp::platform {

MemoryLockStatus LockMemory(void* ptr, std::size_t length) noexcept {
  if (!ptr || length == 0) {
    return MemoryLockStatus::kBestEffort;
  }
#if defined(_WIN32)
  if (::VirtualLock(ptr, length) != 0) {
    return MemoryLockStatus::kLocked;
  }
  return ::GetLastError() == ERROR_NOT_SUPPORTED ? MemoryLockStatus::kUnsupported
                                                 : MemoryLockStatus::kBestEffort;
#elif defined(__unix__) || defined(__APPLE__)
  if (::mlock(ptr, length) == 0) {
    return MemoryLockStatus::kLocked;
  }
  // EPERM/ENOMEM under a tight RLIMIT_MEMLOCK still leaves the data usable.
  return errno == ENOSYS ? MemoryLockStatus::kUnsupported : MemoryLockStatus::kBestEffort;
#else
  (void)ptr;
  (void)length;
  return MemoryLockStatus::kUnsupported;
#endif
}

void UnlockMemory(void* ptr, std::size_t length) noexcept {
  if (!ptr || length == 0) {
    return;
  }
#if defined(_WIN32)
  ::VirtualUnlock(ptr, length);
#elif defined(__unix__) || defined(__APPLE__)
  ::munlock(ptr, length);
#else
  (void)ptr;
  (void)length;
#endif
}

bool MemoryLockSupported() noexcept {
#if defined(_WIN32) || defined(__unix__) || defined(__APPLE__)
  return true;
#else
  return false;
#endif
}

}  // namespace sp::platform

#include "sp/security/zeroizer.h"

#include "sp/orchestrator/event_bus.h"
#include "sp/platform/memory_lock.h"

#include <atomic>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <mutex>
#include <span>
#include <string>
#include <vector>

#if defined(_WIN32)
#define NOMINMAX
#include <windows.h>
#else
#include <sys/mman.h>
#include <sys/resource.h>
#endif

namespace sp::security {
  namespace {

    inline void PortableZero(std::span<uint8_t> data) noexcept {
      if (data.empty()) {
        return;
      }
#if defined(_WIN32)
      ::SecureZeroMemory(data.data(), static_cast<SIZE_T>(data.size()));
#else
      volatile uint8_t* ptr = reinterpret_cast<volatile uint8_t*>(data.data());
      for (std::size_t i = 0; i < data.size(); ++i) {
        ptr[i] = 0;
      }
#if defined(__GNUC__) || defined(__clang__)
      __asm__ __volatile__("" ::: "memory");
#endif
#endif
      std::atomic_thread_fence(std::memory_order_seq_cst);
    }

    struct LockedRegion {
      uint8_t* ptr{nullptr};
      std::size_t size{0};
      std::size_t refcount{0};
    };

    std::mutex g_lock_registry_mutex;
    std::vector<LockedRegion> g_lock_registry;

    void RegisterLock(uint8_t* ptr, std::size_t size) noexcept {
      std::lock_guard<std::mutex> guard(g_lock_registry_mutex);
      for (auto& region : g_lock_registry) {
        if (region.ptr == ptr && region.size == size) {
          region.refcount += 1;
          return;
        }
      }
      g_lock_registry.push_back(LockedRegion{ptr, size, 1});
    }

    bool UnregisterLock(uint8_t* ptr, std::size_t size) noexcept {
      std::lock_guard<std::mutex> guard(g_lock_registry_mutex);
      for (auto it = g_lock_registry.begin(); it != g_lock_registry.end(); ++it) {
        if (it->ptr == ptr && it->size == size) {
          if (it->refcount > 1) {
            it->refcount -= 1;
          } else {
            g_lock_registry.erase(it);
          }
          return true;
        }
      }
      return false;
    }

    void PublishLockWarning(std::string_view event_id, std::string_view message, int err) {
      sp::orchestrator::Event event;
      event.category = sp::orchestrator::EventCategory::kSecurity;
      event.severity = sp::orchestrator::EventSeverity::kWarning;
      event.event_id = std::string(event_id);
      event.message = std::string(message);
      event.fields.emplace_back("errno", std::to_string(err),
                                sp::orchestrator::FieldPrivacy::kPublic, true);
      try {
        sp::orchestrator::EventBus::Instance().Publish(event);
      } catch (const std::exception& ex) {
        // Called from noexcept lock paths; the warning still reaches stderr.
        std::clog << "SecureBuffer warning: event publish failed: " << ex.what() << '\n';
      }
    }

#if !defined(_WIN32)
    // Seeds and derived keys are tiny; a 1 MiB budget covers every live buffer.
    void AdjustMemlockLimitIfNeeded() {
      struct rlimit current {};
      if (::getrlimit(RLIMIT_MEMLOCK, &current) != 0) {
        std::clog << "SecureBuffer warning: unable to query RLIMIT_MEMLOCK; mlock() may fail.\n";
        return;
      }
      constexpr rlim_t kDesired = 1024U * 1024U;
      if (current.rlim_cur >= kDesired) {
        return;
      }
      struct rlimit requested = current;
      requested.rlim_cur = (current.rlim_max == RLIM_INFINITY || current.rlim_max >= kDesired)
                               ? kDesired
                               : current.rlim_max;
      if (requested.rlim_cur <= current.rlim_cur) {
        return;
      }
      if (::setrlimit(RLIMIT_MEMLOCK, &requested) != 0) {
        std::clog << "SecureBuffer warning: could not raise RLIMIT_MEMLOCK.\n";
      }
    }

    void MaybeEnableProcessWideLocking() {
      const char* env = std::getenv("SP_USE_MLOCKALL");
      if (!env || env[0] == '\0' || env[0] == '0') {
        return;
      }
#if (defined(__linux__) || defined(__FreeBSD__)) && defined(MCL_CURRENT) && defined(MCL_FUTURE)
      if (::mlockall(MCL_CURRENT | MCL_FUTURE) != 0) {
        const int err = errno;
        std::clog << "SecureBuffer warning: mlockall() failed despite SP_USE_MLOCKALL; "
                  << "sensitive pages may swap.\n";
        PublishLockWarning("memory_lock_failure", "Process-wide memory locking failed", err);
      }
#else
      std::clog << "SecureBuffer notice: mlockall() not available on this platform; "
                << "SP_USE_MLOCKALL ignored.\n";
#endif
    }

    void EnsurePosixLockingConfigured() {
      static std::once_flag once;
      std::call_once(once, []() {
        AdjustMemlockLimitIfNeeded();
        MaybeEnableProcessWideLocking();
      });
    }
#endif

  } // namespace

  void Zeroizer::Wipe(std::span<uint8_t> data) noexcept {
    PortableZero(data);
    std::atomic_signal_fence(std::memory_order_seq_cst);
  }

  void Zeroizer::WipeString(std::string& text) noexcept {
    if (text.empty()) {
      return;
    }
    Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(text.data()), text.size()));
    text.clear();
  }

  bool Zeroizer::MemoryLockingSupported() noexcept {
    return sp::platform::MemoryLockSupported();
  }

  Zeroizer::LockStatus Zeroizer::TryLockMemory(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return LockStatus::Locked;
    }
#if !defined(_WIN32)
    EnsurePosixLockingConfigured();
#endif
    const auto status = sp::platform::LockMemory(data.data(), data.size());
    if (status == sp::platform::MemoryLockStatus::kLocked) {
      RegisterLock(data.data(), data.size());
      return LockStatus::Locked;
    }
    if (status == sp::platform::MemoryLockStatus::kBestEffort) {
      return LockStatus::BestEffort;
    }
    return LockStatus::Unsupported;
  }

  void Zeroizer::UnlockMemory(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return;
    }
    if (!UnregisterLock(data.data(), data.size())) {
      return;
    }
    sp::platform::UnlockMemory(data.data(), data.size());
  }

} // namespace sp::security

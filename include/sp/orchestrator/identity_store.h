#pragma once

#include <filesystem>
#include <mutex>
#include <optional>

#include "sp/core/seed.h"

namespace sp::orchestrator {

// Where the device keeps its one identity seed.
class IdentityStore {
public:
  virtual ~IdentityStore() = default;
  virtual std::optional<core::Seed> Get() = 0;
  virtual void Set(const core::Seed& seed) = 0;
};

// 64 lowercase hex characters plus a newline in a 0600 file, written by
// atomic replace.
class FileIdentityStore : public IdentityStore {
public:
  explicit FileIdentityStore(std::filesystem::path path);

  // Throws FormatError (kMalformedIdentity) when the file exists but does
  // not hold a hex seed.
  std::optional<core::Seed> Get() override;
  void Set(const core::Seed& seed) override;

  const std::filesystem::path& path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
  std::mutex mutex_;
};

class MemoryIdentityStore : public IdentityStore {
public:
  std::optional<core::Seed> Get() override;
  void Set(const core::Seed& seed) override;

private:
  std::mutex mutex_;
  std::optional<core::Seed> seed_;
};

} // namespace sp::orchestrator

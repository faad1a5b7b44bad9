#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "sp/crypto/argon2id.h"

namespace sp::orchestrator {

struct TransferConfig {
  crypto::Argon2idCost argon2{};
  std::filesystem::path identity_file;
  std::filesystem::path backup_dir;
  std::filesystem::path log_path; // empty disables file logging

  // Defaults, then SP_* environment variables. Throws sp::Error (Config) on
  // unparsable numbers or values below the KDF floors.
  static TransferConfig Load();

  // Same as Load() but reads variables through |lookup|; tests use this to
  // avoid touching the process environment.
  using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;
  static TransferConfig Load(const EnvLookup& lookup);

  // Rechecks the Argon2 floors after CLI overrides.
  void Validate() const;
};

// Strict decimal parse for numeric settings. Throws sp::Error (Config,
// kInvalidValue) naming |setting| on failure.
uint32_t ParseConfigNumber(std::string_view setting, std::string_view value);

} // namespace sp::orchestrator

#include "sp/orchestrator/config.h"

#include "sp/core/backup_cipher.h"
#include "sp/error.h"
#include "sp/errors.h"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <string>

namespace sp::orchestrator {
namespace {

constexpr std::string_view kEnvIterations{"SP_ARGON2_ITERATIONS"};
constexpr std::string_view kEnvMemory{"SP_ARGON2_MEMORY_KIB"};
constexpr std::string_view kEnvParallelism{"SP_ARGON2_PARALLELISM"};
constexpr std::string_view kEnvIdentityFile{"SP_IDENTITY_FILE"};
constexpr std::string_view kEnvBackupDir{"SP_BACKUP_DIR"};
constexpr std::string_view kEnvLogPath{"SP_LOG_PATH"};

std::optional<std::string> ProcessEnv(std::string_view name) {
  const std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::filesystem::path DefaultStateDirectory(const TransferConfig::EnvLookup& lookup) {
#if defined(_WIN32)
  auto home = lookup("USERPROFILE");
#else
  auto home = lookup("HOME");
#endif
  if (!home || home->empty()) {
    return std::filesystem::path(".seedport");
  }
  return std::filesystem::path(*home) / ".seedport";
}

} // namespace

uint32_t ParseConfigNumber(std::string_view setting, std::string_view value) {
  uint64_t parsed = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (value.empty() || ec != std::errc() || ptr != value.data() + value.size() ||
      parsed > std::numeric_limits<uint32_t>::max()) {
    throw Error{ErrorDomain::Config, errors::config::kInvalidValue,
                "Invalid value for " + std::string(setting) + ": '" + std::string(value) + "'"};
  }
  return static_cast<uint32_t>(parsed);
}

TransferConfig TransferConfig::Load() {
  return Load(ProcessEnv);
}

TransferConfig TransferConfig::Load(const EnvLookup& lookup) {
  TransferConfig config;
  const auto state_dir = DefaultStateDirectory(lookup);
  config.identity_file = state_dir / "identity.hex";
  config.backup_dir = state_dir / "backups";

  if (auto value = lookup(kEnvIterations)) {
    config.argon2.time_cost = ParseConfigNumber(kEnvIterations, *value);
  }
  if (auto value = lookup(kEnvMemory)) {
    config.argon2.memory_cost_kib = ParseConfigNumber(kEnvMemory, *value);
  }
  if (auto value = lookup(kEnvParallelism)) {
    config.argon2.parallelism = ParseConfigNumber(kEnvParallelism, *value);
  }
  if (auto value = lookup(kEnvIdentityFile)) {
    config.identity_file = std::filesystem::path(*value);
  }
  if (auto value = lookup(kEnvBackupDir)) {
    config.backup_dir = std::filesystem::path(*value);
  }
  if (auto value = lookup(kEnvLogPath)) {
    config.log_path = std::filesystem::path(*value);
  }
  config.Validate();
  return config;
}

void TransferConfig::Validate() const {
  if (argon2.time_cost < core::kMinArgon2Iterations || argon2.memory_cost_kib < core::kMinArgon2MemoryKiB ||
      argon2.parallelism == 0) {
    throw Error{ErrorDomain::Config, errors::config::kBelowSecurityFloor,
                std::string(errors::msg::kArgon2BelowFloor) + " (minimum 65536 KiB, 2 iterations, 1 lane)"};
  }
  if (argon2.time_cost > core::kMaxArgon2Iterations || argon2.memory_cost_kib > core::kMaxArgon2MemoryKiB ||
      argon2.parallelism > core::kMaxArgon2Parallelism) {
    throw Error{ErrorDomain::Config, errors::config::kInvalidValue,
                "Argon2id parameters exceed the supported maximum"};
  }
  if (identity_file.empty() || backup_dir.empty()) {
    throw Error{ErrorDomain::Config, errors::config::kInvalidValue,
                "Identity file and backup directory must be set"};
  }
}

} // namespace sp::orchestrator

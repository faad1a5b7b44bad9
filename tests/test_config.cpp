#include "sp/error.h"
#include "sp/errors.h"
#include "sp/orchestrator/config.h"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace {

using sp::orchestrator::TransferConfig;

TransferConfig::EnvLookup LookupFrom(std::map<std::string, std::string> env) {
  return [env = std::move(env)](std::string_view name) -> std::optional<std::string> {
    auto it = env.find(std::string(name));
    if (it == env.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

int ConfigErrorCode(std::map<std::string, std::string> env) {
  try {
    (void)TransferConfig::Load(LookupFrom(std::move(env)));
  } catch (const sp::Error& err) {
    assert(err.domain == sp::ErrorDomain::Config);
    assert(sp::ExitCodeFor(err) == 1);
    return err.code;
  }
  return 0;
}

void TestDefaults() {
#if defined(_WIN32)
  auto config = TransferConfig::Load(LookupFrom({{"USERPROFILE", "C:\\Users\\demo"}}));
  const std::filesystem::path home("C:\\Users\\demo");
#else
  auto config = TransferConfig::Load(LookupFrom({{"HOME", "/home/demo"}}));
  const std::filesystem::path home("/home/demo");
#endif
  assert(config.argon2.time_cost == 2);
  assert(config.argon2.memory_cost_kib == 65536);
  assert(config.argon2.parallelism == 1);
  assert(config.identity_file == home / ".seedport" / "identity.hex");
  assert(config.backup_dir == home / ".seedport" / "backups");
  assert(config.log_path.empty());
}

void TestOverrides() {
  auto config = TransferConfig::Load(LookupFrom({{"SP_ARGON2_ITERATIONS", "4"},
                                                 {"SP_ARGON2_MEMORY_KIB", "131072"},
                                                 {"SP_ARGON2_PARALLELISM", "2"},
                                                 {"SP_IDENTITY_FILE", "/tmp/id.hex"},
                                                 {"SP_BACKUP_DIR", "/tmp/backups"},
                                                 {"SP_LOG_PATH", "/tmp/seedport.log"}}));
  assert(config.argon2.time_cost == 4);
  assert(config.argon2.memory_cost_kib == 131072);
  assert(config.argon2.parallelism == 2);
  assert(config.identity_file == std::filesystem::path("/tmp/id.hex"));
  assert(config.backup_dir == std::filesystem::path("/tmp/backups"));
  assert(config.log_path == std::filesystem::path("/tmp/seedport.log"));
}

void TestRejections() {
  assert(ConfigErrorCode({{"SP_ARGON2_ITERATIONS", "1"}}) == sp::errors::config::kBelowSecurityFloor);
  assert(ConfigErrorCode({{"SP_ARGON2_MEMORY_KIB", "32768"}}) == sp::errors::config::kBelowSecurityFloor);
  assert(ConfigErrorCode({{"SP_ARGON2_PARALLELISM", "0"}}) == sp::errors::config::kBelowSecurityFloor);
  assert(ConfigErrorCode({{"SP_ARGON2_ITERATIONS", "65"}}) == sp::errors::config::kInvalidValue);
  assert(ConfigErrorCode({{"SP_ARGON2_ITERATIONS", "two"}}) == sp::errors::config::kInvalidValue);
  assert(ConfigErrorCode({{"SP_ARGON2_MEMORY_KIB", "65536k"}}) == sp::errors::config::kInvalidValue);
  assert(ConfigErrorCode({{"SP_ARGON2_MEMORY_KIB", "-1"}}) == sp::errors::config::kInvalidValue);
  assert(ConfigErrorCode({{"SP_ARGON2_MEMORY_KIB", "99999999999"}}) == sp::errors::config::kInvalidValue);
}

void TestValidateAfterOverride() {
  auto config = TransferConfig::Load(LookupFrom({{"HOME", "/home/demo"}}));
  config.identity_file.clear();
  bool threw = false;
  try {
    config.Validate();
  } catch (const sp::Error& err) {
    threw = err.code == sp::errors::config::kInvalidValue;
  }
  assert(threw);
  assert(sp::orchestrator::ParseConfigNumber("--argon2-iterations", "3") == 3);
}

}  // namespace

int main() {
  TestDefaults();
  TestOverrides();
  TestRejections();
  TestValidateAfterOverride();
  std::cout << "config tests ok\n";
  return 0;
}

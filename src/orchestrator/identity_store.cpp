#include "sp/orchestrator/identity_store.h"

#include "sp/common.h"
#include "sp/error.h"
#include "sp/errors.h"
#include "sp/orchestrator/io_util.h"
#include "sp/security/zeroizer.h"

#include <string>
#include <system_error>

namespace sp::orchestrator {
namespace {

constexpr size_t kMaxIdentityFileBytes = 4096;

void EnsureParentDirectory(const std::filesystem::path& path) {
  const auto parent = path.parent_path();
  if (parent.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, ec.value(),
                "Failed to create directory " + sp::PathToUtf8String(parent) + ": " + ec.message(),
                ec.value()};
  }
}

} // namespace

FileIdentityStore::FileIdentityStore(std::filesystem::path path) : path_(std::move(path)) {}

std::optional<core::Seed> FileIdentityStore::Get() {
  std::lock_guard<std::mutex> guard(mutex_);
  auto contents = ReadSmallFile(path_, kMaxIdentityFileBytes);
  if (!contents) {
    return std::nullopt;
  }
  std::string_view hex(*contents);
  while (!hex.empty() && (hex.back() == '\n' || hex.back() == '\r' || hex.back() == ' ')) {
    hex.remove_suffix(1);
  }
  try {
    auto seed = core::Seed::FromHex(hex);
    sp::security::Zeroizer::WipeString(*contents);
    return seed;
  } catch (const FormatError&) {
    sp::security::Zeroizer::WipeString(*contents);
    throw;
  }
}

void FileIdentityStore::Set(const core::Seed& seed) {
  std::lock_guard<std::mutex> guard(mutex_);
  EnsureParentDirectory(path_);
  std::string payload = seed.ToHex();
  payload.push_back('\n');
  try {
    AtomicReplace(path_, TextBytes(payload));
  } catch (const Error&) {
    sp::security::Zeroizer::WipeString(payload);
    throw;
  }
  sp::security::Zeroizer::WipeString(payload);
}

std::optional<core::Seed> MemoryIdentityStore::Get() {
  std::lock_guard<std::mutex> guard(mutex_);
  return seed_;
}

void MemoryIdentityStore::Set(const core::Seed& seed) {
  std::lock_guard<std::mutex> guard(mutex_);
  seed_ = seed;
}

} // namespace sp::orchestrator

#include "sp/error.h"
#include "sp/orchestrator/io_util.h"

#include <array>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::vector<uint8_t> ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::filesystem::path UniqueDir() {
  auto dir = std::filesystem::temp_directory_path() /
             ("sp_io_util_" +
              std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  std::filesystem::create_directories(dir);
  return dir;
}

}  // namespace

int main() {
  using sp::orchestrator::AtomicReplace;
  using sp::orchestrator::AtomicReplaceHooks;
  using sp::orchestrator::ReadSmallFile;

  const auto dir = UniqueDir();
  const auto target = dir / "identity.hex";

  {
    std::ofstream seed(target, std::ios::binary | std::ios::trunc);
    const std::array<uint8_t, 4> baseline{0xDE, 0xAD, 0xBE, 0xEF};
    seed.write(reinterpret_cast<const char*>(baseline.data()), static_cast<std::streamsize>(baseline.size()));
  }

  AtomicReplaceHooks hooks;
  hooks.before_rename = [](const std::filesystem::path&, const std::filesystem::path&) {
    throw std::runtime_error("simulated crash");
  };

  std::array<uint8_t, 4> update{0xBA, 0xAD, 0xF0, 0x0D};
  bool threw = false;
  try {
    AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()), hooks);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "Expected simulated crash before rename");

  auto bytes = ReadFile(target);
  assert(bytes.size() == 4);
  assert(bytes[0] == 0xDE && bytes[1] == 0xAD && bytes[2] == 0xBE && bytes[3] == 0xEF);

  // The interrupted write leaves no temp file behind.
  size_t entries = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    (void)entry;
    ++entries;
  }
  assert(entries == 1);

  hooks.before_rename = nullptr;
  AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()));

  bytes = ReadFile(target);
  assert(bytes.size() == 4);
  assert(bytes[0] == 0xBA && bytes[1] == 0xAD && bytes[2] == 0xF0 && bytes[3] == 0x0D);

#if !defined(_WIN32)
  const auto perms = std::filesystem::status(target).permissions();
  assert((perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all)) ==
         std::filesystem::perms::none);
#endif

  auto contents = ReadSmallFile(target, 16);
  assert(contents && contents->size() == 4);
  assert(!ReadSmallFile(dir / "missing", 16).has_value());

  threw = false;
  try {
    (void)ReadSmallFile(target, 2);
  } catch (const sp::Error& err) {
    threw = err.domain == sp::ErrorDomain::IO;
  }
  assert(threw && "oversized file must be refused");

  std::filesystem::remove_all(dir);

  std::cout << "atomic replace tests ok\n";
  return 0;
}

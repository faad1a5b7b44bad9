#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "sp/error.h"

namespace sp::orchestrator {

struct AtomicReplaceHooks {
  // Runs after the temp file is synced and closed, before it is renamed over
  // the target. Tests throw from here to simulate a crash mid-replace.
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
};

// Writes |payload| to a 0600 temporary file next to |target|, syncs it, then
// renames it into place and syncs the directory. The target is either the old
// contents or the new contents, never a mix.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});

// Whole-file read. std::nullopt when the file does not exist; sp::Error (IO)
// for any other failure or when the file exceeds |max_bytes|.
std::optional<std::string> ReadSmallFile(const std::filesystem::path& path, size_t max_bytes);

}  // namespace sp::orchestrator

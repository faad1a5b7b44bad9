#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

#include "sp/core/backup_cipher.h"

namespace sp::orchestrator {

// Stores encrypted backups keyed by an opaque identity reference.
class BackupTransport {
public:
  virtual ~BackupTransport() = default;
  virtual void Upload(std::string_view identity_ref, const core::EncryptedBackup& backup) = 0;
  // Throws BackupNotFoundError when nothing is stored for |identity_ref|.
  virtual core::EncryptedBackup Download(std::string_view identity_ref) = 0;
};

// One JSON record per identity, named by the SHA-256 hex of the reference so
// references never appear on disk.
class DirectoryBackupTransport : public BackupTransport {
public:
  explicit DirectoryBackupTransport(std::filesystem::path directory);

  void Upload(std::string_view identity_ref, const core::EncryptedBackup& backup) override;
  core::EncryptedBackup Download(std::string_view identity_ref) override;

  std::filesystem::path RecordPath(std::string_view identity_ref) const;

private:
  std::filesystem::path directory_;
};

// Keeps serialized records so uploads and downloads go through the same JSON
// path as the directory transport.
class MemoryBackupTransport : public BackupTransport {
public:
  void Upload(std::string_view identity_ref, const core::EncryptedBackup& backup) override;
  core::EncryptedBackup Download(std::string_view identity_ref) override;

  // Overwrites the stored record text; used to simulate server-side damage.
  void PutRaw(std::string_view identity_ref, std::string record);

private:
  std::mutex mutex_;
  std::map<std::string, std::string, std::less<>> records_;
};

} // namespace sp::orchestrator

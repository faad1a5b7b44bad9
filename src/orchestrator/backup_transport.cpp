#include "sp/orchestrator/backup_transport.h"

#include "sp/common.h"
#include "sp/core/backup_record.h"
#include "sp/error.h"
#include "sp/errors.h"
#include "sp/orchestrator/event_bus.h"
#include "sp/orchestrator/io_util.h"

#include <string>
#include <system_error>

namespace sp::orchestrator {
namespace {

constexpr size_t kMaxRecordBytes = 64 * 1024;

} // namespace

DirectoryBackupTransport::DirectoryBackupTransport(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path DirectoryBackupTransport::RecordPath(std::string_view identity_ref) const {
  return directory_ / (HashForTelemetry(identity_ref) + ".json");
}

void DirectoryBackupTransport::Upload(std::string_view identity_ref, const core::EncryptedBackup& backup) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, ec.value(),
                "Failed to create backup directory " + sp::PathToUtf8String(directory_) + ": " +
                    ec.message(),
                ec.value()};
  }
  const auto record = core::SerializeBackup(backup);
  AtomicReplace(RecordPath(identity_ref), TextBytes(record));
}

core::EncryptedBackup DirectoryBackupTransport::Download(std::string_view identity_ref) {
  auto record = ReadSmallFile(RecordPath(identity_ref), kMaxRecordBytes);
  if (!record) {
    throw BackupNotFoundError(std::string(errors::msg::kBackupNotFound));
  }
  return core::ParseBackup(*record);
}

void MemoryBackupTransport::Upload(std::string_view identity_ref, const core::EncryptedBackup& backup) {
  auto record = core::SerializeBackup(backup);
  std::lock_guard<std::mutex> guard(mutex_);
  records_.insert_or_assign(std::string(identity_ref), std::move(record));
}

core::EncryptedBackup MemoryBackupTransport::Download(std::string_view identity_ref) {
  std::string record;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = records_.find(identity_ref);
    if (it == records_.end()) {
      throw BackupNotFoundError(std::string(errors::msg::kBackupNotFound));
    }
    record = it->second;
  }
  return core::ParseBackup(record);
}

void MemoryBackupTransport::PutRaw(std::string_view identity_ref, std::string record) {
  std::lock_guard<std::mutex> guard(mutex_);
  records_.insert_or_assign(std::string(identity_ref), std::move(record));
}

} // namespace sp::orchestrator

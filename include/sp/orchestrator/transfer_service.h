#pragma once

#include <array>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "sp/codec/mnemonic.h"
#include "sp/codec/qr_frame.h"
#include "sp/core/backup_cipher.h"
#include "sp/core/seed.h"
#include "sp/orchestrator/backup_transport.h"
#include "sp/orchestrator/identity_store.h"
#include "sp/orchestrator/scan_session.h"

namespace sp::orchestrator {

// Export and import paths for the device identity. The store and transport
// must outlive this object and any future or session it hands out.
class IdentityTransfer {
public:
  IdentityTransfer(IdentityStore& store, BackupTransport& transport,
                   crypto::Argon2idCost cost = {});

  // Generates and stores a fresh seed. Throws sp::Error (State,
  // kIdentityExists) when one is already stored.
  core::Seed InitializeIdentity();

  // Both throw sp::Error (State, kNoIdentity) when nothing is stored.
  codec::Mnemonic ExportMnemonic();
  std::array<std::string, codec::kFrameCount> ExportQrFrames();

  // Decodes typed words and replaces the stored seed. Throws
  // InvalidMnemonicError; the store is untouched on failure.
  core::Seed ImportMnemonic(std::string_view text);

  // Synchronous QR import for callers that already hold every frame string.
  // Throws FormatError, ChecksumMismatchError or InvalidMnemonicError, or
  // FormatError when frames are missing.
  core::Seed ImportQrFrames(const std::vector<std::string>& frames);

  // Live scanning. The session writes to the store on success.
  std::unique_ptr<ScanSession> BeginScan(ScanSession::Listener listener = {});

  // Applies the passphrase policy, encrypts the stored seed and uploads it.
  void CreateBackup(std::string_view identity_ref, std::string_view passphrase);

  // Downloads, decrypts and stores. Throws BackupNotFoundError,
  // DecryptionFailedError or FormatError for a damaged record.
  core::Seed RestoreBackup(std::string_view identity_ref, std::string_view passphrase);

  // Same operations on a background thread. The passphrase copy is wiped
  // when the task ends.
  std::future<void> CreateBackupAsync(std::string identity_ref, std::string passphrase);
  std::future<core::Seed> RestoreBackupAsync(std::string identity_ref, std::string passphrase);

private:
  core::Seed RequireSeed();

  IdentityStore& store_;
  BackupTransport& transport_;
  core::PassphraseBackupCipher cipher_;
};

} // namespace sp::orchestrator

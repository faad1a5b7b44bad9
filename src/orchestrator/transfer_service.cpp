#include "sp/orchestrator/transfer_service.h"

#include "sp/codec/checksum.h"
#include "sp/core/frame_assembler.h"
#include "sp/error.h"
#include "sp/errors.h"
#include "sp/orchestrator/event_bus.h"
#include "sp/orchestrator/passphrase_policy.h"
#include "sp/security/zeroizer.h"

#include <utility>

namespace sp::orchestrator {
namespace {

using sp::security::Zeroizer;

void PublishTransferEvent(EventSeverity severity, std::string event_id, std::string message,
                          std::vector<EventField> fields = {}) {
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = severity;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields = std::move(fields);
  EventBus::Instance().Publish(event);
}

EventField IdentityField(std::string_view identity_ref) {
  return EventField("identity_ref", std::string(identity_ref), FieldPrivacy::kHash);
}

} // namespace

IdentityTransfer::IdentityTransfer(IdentityStore& store, BackupTransport& transport,
                                   crypto::Argon2idCost cost)
    : store_(store), transport_(transport), cipher_(cost) {}

core::Seed IdentityTransfer::RequireSeed() {
  auto seed = store_.Get();
  if (!seed) {
    throw Error{ErrorDomain::State, errors::state::kNoIdentity, std::string(errors::msg::kNoIdentity)};
  }
  return *seed;
}

core::Seed IdentityTransfer::InitializeIdentity() {
  if (store_.Get()) {
    throw Error{ErrorDomain::State, errors::state::kIdentityExists,
                std::string(errors::msg::kIdentityExists)};
  }
  auto seed = core::Seed::Generate();
  store_.Set(seed);
  PublishTransferEvent(EventSeverity::kInfo, "identity_created", "New identity generated");
  return seed;
}

codec::Mnemonic IdentityTransfer::ExportMnemonic() {
  const auto seed = RequireSeed();
  PublishTransferEvent(EventSeverity::kInfo, "mnemonic_exported", "Recovery words displayed");
  return codec::EncodeMnemonic(seed);
}

std::array<std::string, codec::kFrameCount> IdentityTransfer::ExportQrFrames() {
  const auto seed = RequireSeed();
  const auto mnemonic = codec::EncodeMnemonic(seed);
  auto frames = codec::SplitIntoFrames(mnemonic, seed);
  std::array<std::string, codec::kFrameCount> out;
  for (size_t i = 0; i < frames.size(); ++i) {
    out[i] = codec::EncodeFrame(frames[i]);
    Zeroizer::WipeString(frames[i].payload);
  }
  PublishTransferEvent(EventSeverity::kInfo, "qr_frames_exported", "QR transfer frames displayed",
                       {EventField("frames", std::to_string(out.size()), FieldPrivacy::kPublic, true)});
  return out;
}

core::Seed IdentityTransfer::ImportMnemonic(std::string_view text) {
  const auto mnemonic = codec::ParseMnemonicSentence(text);
  auto seed = codec::DecodeMnemonic(mnemonic);
  store_.Set(seed);
  PublishTransferEvent(EventSeverity::kInfo, "mnemonic_imported", "Identity restored from recovery words");
  return seed;
}

core::Seed IdentityTransfer::ImportQrFrames(const std::vector<std::string>& frames) {
  using Status = core::FrameAssembler::Status;
  using Reason = core::FrameAssembler::RejectReason;
  core::FrameAssembler assembler;
  for (const auto& text : frames) {
    const auto outcome = assembler.Submit(text);
    if (outcome.status == Status::kRejected) {
      PublishTransferEvent(EventSeverity::kWarning, "qr_transfer_rejected", "QR transfer attempt rejected",
                           {EventField("reason", core::ToString(*outcome.reason))});
      switch (*outcome.reason) {
      case Reason::kChecksumMismatch:
        throw ChecksumMismatchError(outcome.detail);
      case Reason::kDecodeError:
        throw InvalidMnemonicError(outcome.detail);
      case Reason::kFormatError:
        throw FormatError(outcome.detail);
      case Reason::kInternalError:
        throw Error(ErrorDomain::Crypto, errors::crypto::kDigestFailed, outcome.detail);
      }
    }
    if (outcome.status == Status::kSucceeded) {
      auto seed = *assembler.seed();
      store_.Set(seed);
      PublishTransferEvent(EventSeverity::kInfo, "qr_transfer_completed", "Identity imported from QR frames");
      return seed;
    }
  }
  const auto progress = assembler.Progress();
  throw FormatError("QR transfer incomplete: received " + std::to_string(progress.first) + " of " +
                    std::to_string(codec::kFrameCount) + " frames");
}

std::unique_ptr<ScanSession> IdentityTransfer::BeginScan(ScanSession::Listener listener) {
  return std::make_unique<ScanSession>(store_, std::move(listener));
}

void IdentityTransfer::CreateBackup(std::string_view identity_ref, std::string_view passphrase) {
  EnforcePassphrasePolicy(passphrase);
  const auto seed = RequireSeed();
  const auto backup = cipher_.Encrypt(seed, passphrase);
  transport_.Upload(identity_ref, backup);
  PublishTransferEvent(EventSeverity::kInfo, "backup_created", "Encrypted backup uploaded",
                       {IdentityField(identity_ref),
                        EventField("argon2_memory_kib", std::to_string(backup.params.memory_kib),
                                   FieldPrivacy::kPublic, true),
                        EventField("argon2_iterations", std::to_string(backup.params.iterations),
                                   FieldPrivacy::kPublic, true)});
}

core::Seed IdentityTransfer::RestoreBackup(std::string_view identity_ref, std::string_view passphrase) {
  const auto backup = transport_.Download(identity_ref);
  try {
    auto seed = cipher_.Decrypt(backup, passphrase);
    store_.Set(seed);
    PublishTransferEvent(EventSeverity::kInfo, "backup_restored", "Identity restored from encrypted backup",
                         {IdentityField(identity_ref)});
    return seed;
  } catch (const DecryptionFailedError&) {
    PublishTransferEvent(EventSeverity::kWarning, "backup_decrypt_failed", "Backup decryption failed",
                         {IdentityField(identity_ref)});
    throw;
  }
}

std::future<void> IdentityTransfer::CreateBackupAsync(std::string identity_ref, std::string passphrase) {
  return std::async(std::launch::async, [this, ref = std::move(identity_ref),
                                         secret = std::move(passphrase)]() mutable {
    Zeroizer::ScopeWiper<char> wipe(secret.data(), secret.size());
    CreateBackup(ref, secret);
  });
}

std::future<core::Seed> IdentityTransfer::RestoreBackupAsync(std::string identity_ref, std::string passphrase) {
  return std::async(std::launch::async, [this, ref = std::move(identity_ref),
                                         secret = std::move(passphrase)]() mutable {
    Zeroizer::ScopeWiper<char> wipe(secret.data(), secret.size());
    return RestoreBackup(ref, secret);
  });
}

} // namespace sp::orchestrator

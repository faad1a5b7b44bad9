#pragma once

#include <string_view>

namespace sp::errors::msg {
// Centralized message catalog.
inline constexpr std::string_view kPassphraseEmpty{"Passphrase must not be empty"};
inline constexpr std::string_view kPassphraseTooShort{"Passphrase too short"};
inline constexpr std::string_view kPassphraseTooLong{"Passphrase too long"};
inline constexpr std::string_view kPassphraseEntropyTooLow{"Passphrase entropy too low"};
inline constexpr std::string_view kDecryptionFailed{"Decryption failed: wrong passphrase or corrupted backup"};
inline constexpr std::string_view kBackupNotFound{"No backup found for this identity"};
inline constexpr std::string_view kNoIdentity{"No identity stored on this device"};
inline constexpr std::string_view kIdentityExists{"An identity is already stored on this device"};
inline constexpr std::string_view kIdentityCorrupt{"Stored identity is not a 64-character hex seed"};
inline constexpr std::string_view kMnemonicWordCount{"Mnemonic must contain exactly 24 words"};
inline constexpr std::string_view kMnemonicUnknownWord{"Mnemonic contains a word outside the BIP-39 English list"};
inline constexpr std::string_view kMnemonicChecksum{"Mnemonic checksum does not match"};
inline constexpr std::string_view kFramePrefix{"QR frame does not start with otp-e2ee-seed"};
inline constexpr std::string_view kFrameSeparator{"QR frame is missing a ':' separator"};
inline constexpr std::string_view kFrameIndex{"QR frame index/total is malformed"};
inline constexpr std::string_view kFrameTotal{"QR frame total is not supported"};
inline constexpr std::string_view kFrameWords{"QR data frame must hold 12 lowercase words"};
inline constexpr std::string_view kFrameCheck{"QR check frame must be check:<16 hex chars>"};
inline constexpr std::string_view kChecksumMismatch{"Frame checksum does not match the reconstructed seed"};
inline constexpr std::string_view kBackupRecordMalformed{"Backup record is malformed"};
inline constexpr std::string_view kBackupKdfUnsupported{"Backup uses an unsupported key derivation"};
inline constexpr std::string_view kArgon2DerivationFailed{"Argon2id derivation failed"};
inline constexpr std::string_view kUnsupportedArgon2HashLength{"Unsupported Argon2 hash length"};
inline constexpr std::string_view kArgon2BelowFloor{"Argon2id parameters are below the security floor"};
inline constexpr std::string_view kInvalidBase64{"Invalid base64 encoding"};
}  // namespace sp::errors::msg

#pragma once
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "sp/core/backup_cipher.h"

namespace sp::core {

// JSON wire form of a backup, as stored by a BackupTransport:
//   {"kdf": {"type": "argon2id", "salt": "<b64>", "iterations": 2,
//            "memory": 65536, "parallelism": 1, "hashLength": 32,
//            "nonceLength": 12, "macLength": 16},
//    "ciphertext": "<b64>"}
inline constexpr std::string_view kKdfTypeArgon2id{"argon2id"};

nlohmann::json SerializeKdfParams(const Argon2Params& params);
// Throws FormatError (kMalformedBackupRecord) on missing or mistyped fields.
Argon2Params ParseKdfParams(const nlohmann::json& kdf);

std::string SerializeBackup(const EncryptedBackup& backup);
EncryptedBackup ParseBackup(std::string_view text);

} // namespace sp::core

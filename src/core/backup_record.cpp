#include "sp/core/backup_record.h"

#include "sp/codec/encoding.h"
#include "sp/error.h"
#include "sp/errors.h"

#include <limits>

namespace sp::core {
namespace {

[[noreturn]] void Malformed(std::string_view detail) {
  std::string message(errors::msg::kBackupRecordMalformed);
  message.append(": ");
  message.append(detail);
  throw FormatError(std::move(message), errors::validation::kMalformedBackupRecord);
}

const nlohmann::json& Field(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end()) {
    Malformed(std::string("missing ") + key);
  }
  return *it;
}

uint32_t UintField(const nlohmann::json& object, const char* key) {
  const auto& value = Field(object, key);
  if (!value.is_number_unsigned()) {
    Malformed(std::string(key) + " is not an unsigned integer");
  }
  const auto raw = value.get<uint64_t>();
  if (raw > std::numeric_limits<uint32_t>::max()) {
    Malformed(std::string(key) + " is out of range");
  }
  return static_cast<uint32_t>(raw);
}

std::string StringField(const nlohmann::json& object, const char* key) {
  const auto& value = Field(object, key);
  if (!value.is_string()) {
    Malformed(std::string(key) + " is not a string");
  }
  return value.get<std::string>();
}

} // namespace

nlohmann::json SerializeKdfParams(const Argon2Params& params) {
  nlohmann::json kdf;
  kdf["type"] = std::string(kKdfTypeArgon2id);
  kdf["salt"] = codec::Base64Encode(params.salt);
  kdf["iterations"] = params.iterations;
  kdf["memory"] = params.memory_kib;
  kdf["parallelism"] = params.parallelism;
  kdf["hashLength"] = params.hash_length;
  kdf["nonceLength"] = params.nonce_length;
  kdf["macLength"] = params.mac_length;
  return kdf;
}

Argon2Params ParseKdfParams(const nlohmann::json& kdf) {
  if (!kdf.is_object()) {
    Malformed("kdf is not an object");
  }
  if (StringField(kdf, "type") != kKdfTypeArgon2id) {
    throw FormatError(std::string(errors::msg::kBackupKdfUnsupported),
                      errors::validation::kMalformedBackupRecord);
  }
  Argon2Params params;
  auto salt = codec::Base64Decode(StringField(kdf, "salt"));
  if (!salt) {
    Malformed(errors::msg::kInvalidBase64);
  }
  params.salt = std::move(*salt);
  params.iterations = UintField(kdf, "iterations");
  params.memory_kib = UintField(kdf, "memory");
  params.parallelism = UintField(kdf, "parallelism");
  params.hash_length = UintField(kdf, "hashLength");
  params.nonce_length = UintField(kdf, "nonceLength");
  params.mac_length = UintField(kdf, "macLength");
  return params;
}

std::string SerializeBackup(const EncryptedBackup& backup) {
  nlohmann::json record;
  record["kdf"] = SerializeKdfParams(backup.params);
  record["ciphertext"] = backup.ciphertext;
  return record.dump();
}

EncryptedBackup ParseBackup(std::string_view text) {
  nlohmann::json record;
  try {
    record = nlohmann::json::parse(text.begin(), text.end());
  } catch (const nlohmann::json::parse_error& err) {
    Malformed(err.what());
  }
  if (!record.is_object()) {
    Malformed("record is not an object");
  }
  EncryptedBackup backup;
  backup.params = ParseKdfParams(Field(record, "kdf"));
  backup.ciphertext = StringField(record, "ciphertext");
  return backup;
}

} // namespace sp::core

#include "sp/core/backup_cipher.h"
#include "sp/core/backup_record.h"
#include "sp/error.h"

#include <nlohmann/json.hpp>

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

sp::core::EncryptedBackup SampleBackup() {
  sp::core::EncryptedBackup backup;
  backup.params.salt = std::vector<uint8_t>(16, 0xAB);
  backup.params.iterations = 3;
  backup.params.memory_kib = 65536;
  backup.params.parallelism = 2;
  backup.ciphertext = "c2VlZHBvcnQ=";
  return backup;
}

bool ParseRejects(const std::string& text) {
  try {
    (void)sp::core::ParseBackup(text);
  } catch (const sp::FormatError& err) {
    assert(err.code == sp::errors::validation::kMalformedBackupRecord);
    return true;
  }
  return false;
}

void TestSerializedShape() {
  const auto text = sp::core::SerializeBackup(SampleBackup());
  const auto json = nlohmann::json::parse(text);
  assert(json.at("ciphertext") == "c2VlZHBvcnQ=");
  const auto& kdf = json.at("kdf");
  assert(kdf.at("type") == "argon2id");
  assert(kdf.at("salt") == "q6urq6urq6urq6urq6urqw==");
  assert(kdf.at("iterations") == 3);
  assert(kdf.at("memory") == 65536);
  assert(kdf.at("parallelism") == 2);
  assert(kdf.at("hashLength") == 32);
  assert(kdf.at("nonceLength") == 12);
  assert(kdf.at("macLength") == 16);
}

void TestParse() {
  const auto parsed = sp::core::ParseBackup(sp::core::SerializeBackup(SampleBackup()));
  const auto expected = SampleBackup();
  assert(parsed.params.salt == expected.params.salt);
  assert(parsed.params.iterations == 3);
  assert(parsed.params.memory_kib == 65536);
  assert(parsed.params.parallelism == 2);
  assert(parsed.ciphertext == expected.ciphertext);

  // Unknown extra fields are tolerated.
  auto json = nlohmann::json::parse(sp::core::SerializeBackup(SampleBackup()));
  json["version"] = 1;
  json["kdf"]["note"] = "x";
  assert(sp::core::ParseBackup(json.dump()).params.iterations == 3);
}

void TestMalformed() {
  assert(ParseRejects(""));
  assert(ParseRejects("{"));
  assert(ParseRejects("[]"));
  assert(ParseRejects("{\"ciphertext\":\"AAAA\"}"));

  auto json = nlohmann::json::parse(sp::core::SerializeBackup(SampleBackup()));
  auto without_salt = json;
  without_salt["kdf"].erase("salt");
  assert(ParseRejects(without_salt.dump()));

  auto wrong_type = json;
  wrong_type["kdf"]["type"] = "scrypt";
  assert(ParseRejects(wrong_type.dump()));

  auto negative = json;
  negative["kdf"]["iterations"] = -1;
  assert(ParseRejects(negative.dump()));

  auto string_number = json;
  string_number["kdf"]["memory"] = "65536";
  assert(ParseRejects(string_number.dump()));

  auto oversized = json;
  oversized["kdf"]["memory"] = 0x100000000ull;
  assert(ParseRejects(oversized.dump()));

  auto bad_salt = json;
  bad_salt["kdf"]["salt"] = "not base64";
  assert(ParseRejects(bad_salt.dump()));

  auto numeric_ciphertext = json;
  numeric_ciphertext["ciphertext"] = 5;
  assert(ParseRejects(numeric_ciphertext.dump()));
}

}  // namespace

int main() {
  TestSerializedShape();
  TestParse();
  TestMalformed();
  std::cout << "backup record tests ok\n";
  return 0;
}

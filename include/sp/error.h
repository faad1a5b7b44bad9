#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sp {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Dependency = 0x06,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // platform error numbers. Codes inside the reserved range are stable across
  // releases.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Dependency:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kConsoleUnavailable = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kConsoleEchoDisableFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kPassphraseReadFailed = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kBackupNotFound = Make(ErrorDomain::IO, 0x04);
    } // namespace io

    namespace validation {
      inline constexpr int kMalformedFrame = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kChecksumMismatch = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kInvalidMnemonic = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kMalformedBackupRecord = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kPassphraseRejected = Make(ErrorDomain::Validation, 0x05);
      inline constexpr int kMalformedIdentity = Make(ErrorDomain::Validation, 0x06);
      inline constexpr int kInvalidEncoding = Make(ErrorDomain::Validation, 0x07);
    } // namespace validation

    namespace security {
      inline constexpr int kDecryptionFailed = Make(ErrorDomain::Security, 0x01);
    } // namespace security

    namespace crypto {
      inline constexpr int kArgon2DerivationFailed = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kUnsupportedArgon2Parameters = Make(ErrorDomain::Crypto, 0x02);
      inline constexpr int kDigestFailed = Make(ErrorDomain::Crypto, 0x03);
    } // namespace crypto

    namespace config {
      inline constexpr int kInvalidValue = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kBelowSecurityFloor = Make(ErrorDomain::Config, 0x02);
    } // namespace config

    namespace state {
      inline constexpr int kNoIdentity = Make(ErrorDomain::State, 0x01);
      inline constexpr int kIdentityExists = Make(ErrorDomain::State, 0x02);
    } // namespace state

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  // Raised by the AEAD layer when a GCM tag does not verify.
  struct AuthenticationFailureError : public std::runtime_error {
    explicit AuthenticationFailureError(const std::string& msg) : std::runtime_error(msg) {}
  };

  // User-recoverable failures. None of these are retried automatically; the
  // user corrects the input and tries again.

  // Malformed QR text, wrong word count in a frame, unparseable backup record.
  struct FormatError : public Error {
    explicit FormatError(std::string msg,
                         int c = errors::validation::kMalformedFrame)
        : Error(ErrorDomain::Validation, c, std::move(msg), std::nullopt,
                Retryability::kRetryable) {}
  };

  struct ChecksumMismatchError : public Error {
    explicit ChecksumMismatchError(std::string msg)
        : Error(ErrorDomain::Validation, errors::validation::kChecksumMismatch,
                std::move(msg), std::nullopt, Retryability::kRetryable) {}
  };

  struct InvalidMnemonicError : public Error {
    explicit InvalidMnemonicError(std::string msg)
        : Error(ErrorDomain::Validation, errors::validation::kInvalidMnemonic,
                std::move(msg), std::nullopt, Retryability::kRetryable) {}
  };

  // Never says whether the passphrase was wrong or the blob was damaged.
  struct DecryptionFailedError : public Error {
    DecryptionFailedError();
  };

  struct BackupNotFoundError : public Error {
    explicit BackupNotFoundError(std::string msg)
        : Error(ErrorDomain::IO, errors::io::kBackupNotFound, std::move(msg),
                std::nullopt, Retryability::kRetryable) {}
  };

  // Process exit status for an error, shared by the CLI and tests.
  int ExitCodeFor(const Error& error) noexcept;
} // namespace sp

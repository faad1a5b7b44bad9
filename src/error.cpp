#include "sp/error.h"

#include "sp/errors.h"

namespace sp {

DecryptionFailedError::DecryptionFailedError()
    : Error(ErrorDomain::Security, errors::security::kDecryptionFailed,
            std::string(errors::msg::kDecryptionFailed), std::nullopt,
            Retryability::kRetryable) {}

int ExitCodeFor(const Error& error) noexcept {
  if (error.retryability == Retryability::kRetryable) {
    return 2;
  }
  if (error.domain == ErrorDomain::Config) {
    return 1;
  }
  return 3;
}

} // namespace sp

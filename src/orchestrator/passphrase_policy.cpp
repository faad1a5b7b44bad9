#include "sp/orchestrator/passphrase_policy.h"

#include <array>
#include <cmath>
#include <cstddef>
#include <string>

#include "sp/error.h"
#include "sp/errors.h"

namespace sp::orchestrator {
namespace {

constexpr std::size_t kMinPassphraseLen = 8;
constexpr std::size_t kMaxPassphraseLen = 1024;
constexpr double kMinTotalEntropyBits = 24.0;

enum class ValidationCheck : std::size_t {
  kEmpty = 0,
  kMinLength,
  kMaxLength,
  kEntropy,
  kCount
};

constexpr std::array<ValidationCheck, static_cast<std::size_t>(ValidationCheck::kCount)>
    kValidationOrder = {
        ValidationCheck::kEmpty,
        ValidationCheck::kMinLength,
        ValidationCheck::kMaxLength,
        ValidationCheck::kEntropy,
};

std::string_view MessageFor(ValidationCheck check) {
  switch (check) {
    case ValidationCheck::kEmpty:
      return sp::errors::msg::kPassphraseEmpty;
    case ValidationCheck::kMinLength:
      return sp::errors::msg::kPassphraseTooShort;
    case ValidationCheck::kMaxLength:
      return sp::errors::msg::kPassphraseTooLong;
    case ValidationCheck::kEntropy:
    case ValidationCheck::kCount:
      break;
  }
  return sp::errors::msg::kPassphraseEntropyTooLow;
}

}  // namespace

double EstimatePassphraseEntropyBits(std::string_view passphrase) noexcept {
  if (passphrase.empty()) {
    return 0.0;
  }

  std::array<std::size_t, 256> counts{};
  for (unsigned char ch : passphrase) {
    ++counts[ch];
  }

  const double length = static_cast<double>(passphrase.size());
  double per_character = 0.0;
  for (auto count : counts) {
    if (count == 0) {
      continue;
    }
    const double probability = static_cast<double>(count) / length;
    per_character -= probability * std::log2(probability);
  }
  return per_character * length;
}

void EnforcePassphrasePolicy(std::string_view passphrase) {
  const auto size = passphrase.size();
  // Every check runs so the time taken does not depend on which one fails.
  std::array<bool, static_cast<std::size_t>(ValidationCheck::kCount)> failed{};
  failed[static_cast<std::size_t>(ValidationCheck::kEmpty)] = size == 0;
  failed[static_cast<std::size_t>(ValidationCheck::kMinLength)] = size < kMinPassphraseLen;
  failed[static_cast<std::size_t>(ValidationCheck::kMaxLength)] = size > kMaxPassphraseLen;
  failed[static_cast<std::size_t>(ValidationCheck::kEntropy)] =
      EstimatePassphraseEntropyBits(passphrase) < kMinTotalEntropyBits;

  for (auto check : kValidationOrder) {
    if (failed[static_cast<std::size_t>(check)]) {
      throw sp::Error{sp::ErrorDomain::Validation, sp::errors::validation::kPassphraseRejected,
                      std::string(MessageFor(check)), std::nullopt, sp::Retryability::kRetryable};
    }
  }
}

}  // namespace sp::orchestrator

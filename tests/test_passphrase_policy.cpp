#include "sp/error.h"
#include "sp/errors.h"
#include "sp/orchestrator/passphrase_policy.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <string_view>

namespace {

std::string RejectionMessage(std::string_view passphrase) {
  try {
    sp::orchestrator::EnforcePassphrasePolicy(passphrase);
  } catch (const sp::Error& err) {
    assert(err.domain == sp::ErrorDomain::Validation);
    assert(err.code == sp::errors::validation::kPassphraseRejected);
    assert(err.retryability == sp::Retryability::kRetryable);
    return err.what();
  }
  return {};
}

}  // namespace

int main() {
  assert(RejectionMessage("") == sp::errors::msg::kPassphraseEmpty);
  assert(RejectionMessage("abc") == sp::errors::msg::kPassphraseTooShort);
  assert(RejectionMessage(std::string(1025, 'x')) == sp::errors::msg::kPassphraseTooLong);
  assert(RejectionMessage("aabbccdd") == sp::errors::msg::kPassphraseEntropyTooLow);
  assert(RejectionMessage(std::string(64, 'a')) == sp::errors::msg::kPassphraseEntropyTooLow);

  assert(RejectionMessage("abcdefgh").empty());
  assert(RejectionMessage("correct horse battery staple").empty());

  assert(sp::orchestrator::EstimatePassphraseEntropyBits("") == 0.0);
  assert(sp::orchestrator::EstimatePassphraseEntropyBits("aaaa") == 0.0);
  assert(std::fabs(sp::orchestrator::EstimatePassphraseEntropyBits("abcdefgh") - 24.0) < 1e-9);

  std::cout << "passphrase policy tests ok\n";
  return 0;
}

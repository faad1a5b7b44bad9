#pragma once

#include <string_view>

namespace sp::orchestrator {

// Throws sp::Error (Validation, kPassphraseRejected, retryable) when a new
// backup passphrase is empty, shorter than 8 or longer than 1024 bytes, or
// carries less than 24 bits of Shannon entropy in total.
void EnforcePassphrasePolicy(std::string_view passphrase);

// Shannon entropy of the byte distribution times the length, in bits.
double EstimatePassphraseEntropyBits(std::string_view passphrase) noexcept;

}  // namespace sp::orchestrator

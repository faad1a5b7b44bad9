#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "sp/core/seed.h"

namespace sp::core {

// Collects scanned QR frames for one transfer attempt and validates them once
// every index has arrived. Not thread-safe; ScanSession serializes access.
class FrameAssembler {
public:
  enum class Phase { kEmpty, kCollecting, kValidating, kSucceeded };

  enum class Status {
    kStored,           // new index recorded, more frames needed
    kDuplicate,        // index already held; state unchanged
    kIgnored,          // validating or already succeeded
    kReadyToValidate,  // last missing index arrived; call Validate()
    kSucceeded,
    kRejected,
  };

  enum class RejectReason { kFormatError, kChecksumMismatch, kDecodeError, kInternalError };

  struct Outcome {
    Status status{Status::kIgnored};
    std::optional<RejectReason> reason;
    std::string detail;
  };

  FrameAssembler() = default;
  ~FrameAssembler();
  FrameAssembler(const FrameAssembler&) = delete;
  FrameAssembler& operator=(const FrameAssembler&) = delete;

  Outcome Accept(std::string_view text);
  // Only meaningful in kValidating; otherwise reports kIgnored.
  Outcome Validate();
  // Accept, then Validate when the last frame arrived.
  Outcome Submit(std::string_view text);

  Phase phase() const noexcept;
  // Non-null only in kSucceeded.
  const Seed* seed() const noexcept;

  std::vector<uint32_t> ReceivedIndices() const;
  // {received, total}; total is 0 before the first frame.
  std::pair<uint32_t, uint32_t> Progress() const noexcept;

  void Reset() noexcept;

private:
  struct Empty {};
  struct Collecting {
    uint32_t total{0};
    std::map<uint32_t, std::string> payloads;
  };
  struct Validating {
    uint32_t total{0};
    std::map<uint32_t, std::string> payloads;
  };
  struct Succeeded {
    Seed seed;
  };
  using State = std::variant<Empty, Collecting, Validating, Succeeded>;

  Outcome Reject(RejectReason reason, std::string detail);
  static void WipePayloads(std::map<uint32_t, std::string>& payloads) noexcept;

  State state_{Empty{}};
};

const char* ToString(FrameAssembler::RejectReason reason) noexcept;

} // namespace sp::core

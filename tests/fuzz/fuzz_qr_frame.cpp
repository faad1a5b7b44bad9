#include <cstddef>
#include <cstdint>
#include <string_view>

#include "sp/core/frame_assembler.h"

// Feeds newline-separated frames through one assembler.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  if (data == nullptr) {
    return 0;
  }
  std::string_view input(reinterpret_cast<const char*>(data), size);
  sp::core::FrameAssembler assembler;
  while (!input.empty()) {
    const size_t end = input.find('\n');
    const auto line = input.substr(0, end);
    (void)assembler.Submit(line);
    if (end == std::string_view::npos) {
      break;
    }
    input.remove_prefix(end + 1);
  }
  return 0;
}

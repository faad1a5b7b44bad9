#include "sp/codec/checksum.h"
#include "sp/codec/mnemonic.h"
#include "sp/codec/qr_frame.h"
#include "sp/core/seed.h"
#include "sp/error.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

const std::string kTwelveAbandon =
    "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon";

bool ParseRejects(const std::string& text) {
  try {
    (void)sp::codec::ParseFrame(text);
  } catch (const sp::FormatError&) {
    return true;
  }
  return false;
}

void TestSplitAndEncode() {
  std::array<uint8_t, sp::core::kSeedSize> bytes{};
  sp::core::Seed seed(bytes);
  auto mnemonic = sp::codec::EncodeMnemonic(seed);
  auto frames = sp::codec::SplitIntoFrames(mnemonic, seed);

  assert(sp::codec::EncodeFrame(frames[0]) == "otp-e2ee-seed:1/3:" + kTwelveAbandon);
  assert(sp::codec::EncodeFrame(frames[1]) ==
         "otp-e2ee-seed:2/3:abandon abandon abandon abandon abandon abandon abandon abandon abandon "
         "abandon abandon art");
  assert(sp::codec::EncodeFrame(frames[2]) == "otp-e2ee-seed:3/3:check:33ad0a1c607ec03b");
  assert(frames[2].IsCheckFrame());
  assert(frames[2].CheckHex() == "33ad0a1c607ec03b");
  assert(!frames[0].IsCheckFrame());
  assert(frames[0].CheckHex().empty());

  for (const auto& frame : frames) {
    auto parsed = sp::codec::ParseFrame(sp::codec::EncodeFrame(frame));
    assert(parsed.index == frame.index);
    assert(parsed.total == frame.total);
    assert(parsed.payload == frame.payload);
  }
}

void TestSplitRequiresFullMnemonic() {
  std::vector<std::string> words(12, "abandon");
  bool threw = false;
  try {
    (void)sp::codec::SplitIntoFrames(sp::codec::Mnemonic(words), sp::core::Seed::Generate());
  } catch (const sp::InvalidMnemonicError&) {
    threw = true;
  }
  assert(threw);
}

void TestMalformedFrames() {
  assert(ParseRejects(""));
  assert(ParseRejects("hello world"));
  assert(ParseRejects("otp-e2ee-seeds:1/3:" + kTwelveAbandon));
  assert(ParseRejects("otp-e2ee-seed:1/3"));
  assert(ParseRejects("otp-e2ee-seed:13:" + kTwelveAbandon));
  assert(ParseRejects("otp-e2ee-seed:0/3:" + kTwelveAbandon));
  assert(ParseRejects("otp-e2ee-seed:01/3:" + kTwelveAbandon));
  assert(ParseRejects("otp-e2ee-seed:+1/3:" + kTwelveAbandon));
  assert(ParseRejects("otp-e2ee-seed:4/3:" + kTwelveAbandon));
  assert(ParseRejects("otp-e2ee-seed:1/4:" + kTwelveAbandon));
  assert(ParseRejects("otp-e2ee-seed:1/3:abandon"));
  assert(ParseRejects("otp-e2ee-seed:1/3:" + kTwelveAbandon + " abandon"));
  assert(ParseRejects("otp-e2ee-seed:1/3:" + kTwelveAbandon + " "));
  assert(ParseRejects("otp-e2ee-seed:1/3:Abandon" + kTwelveAbandon.substr(7)));
  assert(ParseRejects("otp-e2ee-seed:1/3:abandon  abandon abandon abandon abandon abandon abandon "
                      "abandon abandon abandon abandon abandon"));
  assert(ParseRejects("otp-e2ee-seed:3/3:check:33ad0a1c607ec03"));
  assert(ParseRejects("otp-e2ee-seed:3/3:check:33ad0a1c607ec03b0"));
  assert(ParseRejects("otp-e2ee-seed:3/3:" + kTwelveAbandon));
  assert(ParseRejects("otp-e2ee-seed:2/3:check:33ad0a1c607ec03b"));
}

void TestWordsOutsideListParse() {
  // Frame parsing checks shape only; wordlist membership is checked at decode.
  auto frame = sp::codec::ParseFrame(
      "otp-e2ee-seed:2/3:foo bar baz qux foo bar baz qux foo bar baz qux");
  assert(frame.index == 2);
  assert(frame.total == 3);
}

}  // namespace

int main() {
  TestSplitAndEncode();
  TestSplitRequiresFullMnemonic();
  TestMalformedFrames();
  TestWordsOutsideListParse();
  std::cout << "qr frame tests ok\n";
  return 0;
}

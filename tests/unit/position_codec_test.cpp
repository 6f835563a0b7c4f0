#include "internal/cdc/position.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using pgcdc::cdc::PositionCodec;
using pgcdc::util::Lsn;

bool ThrowsFormatError(const std::string& token) {
  try {
    (void)PositionCodec::Decode(token);
  } catch (const pgcdc::util::FormatError&) {
    return true;
  }
  return false;
}

void TestRoundTrip() {
  for (Lsn lsn : {Lsn{0}, Lsn{1}, Lsn{0x16B3748}, (Lsn{0x16} << 32) | 0xB374D848, ~Lsn{0}}) {
    assert(PositionCodec::Decode(PositionCodec::Encode(lsn)) == lsn);
  }
}

void TestTokenIsTaggedCdc() {
  const auto token = PositionCodec::Encode(0x16B3748);
  assert(token.find("POSITION_TYPE_CDC") != std::string::npos);
  assert(token.find("0/16B3748") != std::string::npos);
}

void TestForeignKindsAreRejected() {
  assert(ThrowsFormatError(R"({"type":"POSITION_TYPE_SNAPSHOT","lastLsn":"0/1"})"));
  // initial is the proto default, so it is also what an untyped token means
  assert(ThrowsFormatError(R"({"lastLsn":"0/1"})"));
  assert(ThrowsFormatError("{}"));
}

void TestMalformedTokensAreRejected() {
  assert(ThrowsFormatError(""));
  assert(ThrowsFormatError("not json"));
  assert(ThrowsFormatError(R"({"type":"POSITION_TYPE_CDC","lastLsn":"nope"})"));
  assert(ThrowsFormatError(R"({"type":"POSITION_TYPE_CDC","lastLsn":"0/1","extra":true})"));
}

void TestCompareOrdersByLsn() {
  const auto a = PositionCodec::Encode(10);
  const auto b = PositionCodec::Encode(Lsn{1} << 32);
  assert(PositionCodec::Compare(a, b) < 0);
  assert(PositionCodec::Compare(b, a) > 0);
  assert(PositionCodec::Compare(a, PositionCodec::Encode(10)) == 0);
}

} // namespace

int main() {
  TestRoundTrip();
  TestTokenIsTaggedCdc();
  TestForeignKindsAreRejected();
  TestMalformedTokensAreRejected();
  TestCompareOrdersByLsn();

  std::cout << "pgcdc_unit_position_codec: pass\n";
  return 0;
}

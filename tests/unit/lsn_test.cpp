#include "internal/util/lsn.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using pgcdc::util::FormatLsn;
using pgcdc::util::Lsn;
using pgcdc::util::ParseLsn;

void TestFormatMatchesServerNotation() {
  assert(FormatLsn(0) == "0/0");
  assert(FormatLsn(0x16B3748) == "0/16B3748");
  assert(FormatLsn((Lsn{0x16} << 32) | 0xB374D848) == "16/B374D848");
}

void TestParseAcceptsEitherCase() {
  assert(ParseLsn("16/B374D848") == ((Lsn{0x16} << 32) | 0xB374D848));
  assert(ParseLsn("16/b374d848") == ((Lsn{0x16} << 32) | 0xB374D848));
  assert(ParseLsn("FFFFFFFF/FFFFFFFF") == ~Lsn{0});
}

void TestParseRejectsMalformed() {
  for (const char* bad : {"", "0", "/", "0/", "/0", "0/0/0", "G/0", "123456789/0", "0x1/0"}) {
    bool threw = false;
    try {
      (void)ParseLsn(bad);
    } catch (const pgcdc::util::FormatError&) {
      threw = true;
    }
    assert(threw && "malformed LSN must be rejected");
  }
}

} // namespace

int main() {
  TestFormatMatchesServerNotation();
  TestParseAcceptsEitherCase();
  TestParseRejectsMalformed();

  std::cout << "pgcdc_unit_lsn: pass\n";
  return 0;
}

#pragma once

#include <string>
#include <string_view>

#include "internal/util/lsn.hpp"

namespace pgcdc::cdc {

/*
  Resumable stream position.

  The token is the JSON form of cdc.v1.Position with type CDC. Tokens of
  any other type (initial, snapshot) are rejected with FormatError.
*/
class PositionCodec {
 public:
  static std::string Encode(util::Lsn last_lsn);

  // throws FormatError
  static util::Lsn Decode(std::string_view token);

  // <0, 0, >0 by LSN. throws FormatError
  static int Compare(std::string_view a, std::string_view b);
};

} // namespace pgcdc::cdc

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pgcdc::util {

/*
  Log sequence number helpers

  An LSN is a 64-bit WAL offset. PostgreSQL prints it as two 32-bit
  halves in hex: "16/B374D848".
*/

using Lsn = std::uint64_t;

std::string FormatLsn(Lsn lsn);

// throws FormatError
Lsn ParseLsn(std::string_view text);

} // namespace pgcdc::util

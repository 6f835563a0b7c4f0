#include "lsn.hpp"

#include <iomanip>
#include <sstream>

#include "errors.hpp"

namespace pgcdc::util {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::uint32_t ParseHalf(std::string_view hex, std::string_view whole) {
  if (hex.empty() || hex.size() > 8) {
    throw FormatError("invalid LSN \"" + std::string(whole) + "\"");
  }

  std::uint32_t value = 0;
  for (char c : hex) {
    const int nibble = HexNibble(c);
    if (nibble < 0) {
      throw FormatError("invalid LSN \"" + std::string(whole) + "\": non-hex character");
    }
    value = (value << 4) | static_cast<std::uint32_t>(nibble);
  }
  return value;
}

} // namespace

std::string FormatLsn(Lsn lsn) {
  std::ostringstream oss;
  oss << std::uppercase << std::hex << static_cast<std::uint32_t>(lsn >> 32) << '/'
      << static_cast<std::uint32_t>(lsn);
  return oss.str();
}

Lsn ParseLsn(std::string_view text) {
  const auto slash = text.find('/');
  if (slash == std::string_view::npos || text.find('/', slash + 1) != std::string_view::npos) {
    throw FormatError("invalid LSN \"" + std::string(text) + "\": expected X/X");
  }

  const auto hi = ParseHalf(text.substr(0, slash), text);
  const auto lo = ParseHalf(text.substr(slash + 1), text);
  return (static_cast<Lsn>(hi) << 32) | lo;
}

} // namespace pgcdc::util

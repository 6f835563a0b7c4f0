#include "value_decoder.hpp"

#include <charconv>
#include <cstring>
#include <string>

#include "internal/util/errors.hpp"

namespace pgcdc::relation {

namespace {

[[noreturn]] void Fail(std::uint32_t type_oid, std::string_view what, std::string_view input) {
  throw util::DecodeError("cannot decode " + std::string(what) + " value \"" + std::string(input) + "\" (type oid " +
                          std::to_string(type_oid) + ")");
}

std::int64_t ParseInteger(std::uint32_t type_oid, std::string_view text) {
  std::int64_t v   = 0;
  const auto*  end = text.data() + text.size();
  auto [ptr, ec]   = std::from_chars(text.data(), end, v);
  if (ec != std::errc() || ptr != end) {
    Fail(type_oid, "integer", text);
  }
  return v;
}

// from_chars is locale independent and accepts the NaN / Infinity
// spellings the server emits
double ParseFloat(std::uint32_t type_oid, std::string_view text) {
  double      v   = 0;
  const auto* end = text.data() + text.size();
  auto [ptr, ec]  = std::from_chars(text.data(), end, v);
  if (ec != std::errc() || ptr != end) {
    Fail(type_oid, "float", text);
  }
  return v;
}

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::string ParseByteaHex(std::uint32_t type_oid, std::string_view text) {
  if (text.size() < 2 || text[0] != '\\' || text[1] != 'x' || text.size() % 2 != 0) {
    Fail(type_oid, "bytea", text);
  }

  std::string bytes;
  bytes.reserve((text.size() - 2) / 2);
  for (std::size_t i = 2; i < text.size(); i += 2) {
    const int hi = HexNibble(text[i]);
    const int lo = HexNibble(text[i + 1]);
    if (hi < 0 || lo < 0) {
      Fail(type_oid, "bytea", text);
    }
    bytes.push_back(static_cast<char>((hi << 4) | lo));
  }
  return bytes;
}

std::uint64_t ReadBigEndian(std::string_view data) {
  std::uint64_t v = 0;
  for (char c : data) {
    v = (v << 8) | static_cast<std::uint8_t>(c);
  }
  return v;
}

void RequireWidth(std::uint32_t type_oid, std::string_view data, std::size_t width) {
  if (data.size() != width) {
    throw util::DecodeError("binary value for type oid " + std::to_string(type_oid) + " has " +
                            std::to_string(data.size()) + " bytes, expected " + std::to_string(width));
  }
}

} // namespace

model::Value DecodeText(std::uint32_t type_oid, std::string_view text) {
  switch (type_oid) {
    case oid::kBool:
      if (text == "t" || text == "true") return true;
      if (text == "f" || text == "false") return false;
      Fail(type_oid, "bool", text);

    case oid::kInt2:
    case oid::kInt4:
    case oid::kInt8:
    case oid::kOid:
      return ParseInteger(type_oid, text);

    case oid::kFloat4:
    case oid::kFloat8:
      return ParseFloat(type_oid, text);

    case oid::kBytea:
      return ParseByteaHex(type_oid, text);

    default:
      return std::string(text);
  }
}

model::Value DecodeBinary(std::uint32_t type_oid, std::string_view data) {
  switch (type_oid) {
    case oid::kBool:
      RequireWidth(type_oid, data, 1);
      return data[0] != 0;

    case oid::kInt2:
      RequireWidth(type_oid, data, 2);
      return static_cast<std::int64_t>(static_cast<std::int16_t>(ReadBigEndian(data)));

    case oid::kInt4:
      RequireWidth(type_oid, data, 4);
      return static_cast<std::int64_t>(static_cast<std::int32_t>(ReadBigEndian(data)));

    case oid::kOid:
      RequireWidth(type_oid, data, 4);
      return static_cast<std::int64_t>(static_cast<std::uint32_t>(ReadBigEndian(data)));

    case oid::kInt8:
      RequireWidth(type_oid, data, 8);
      return static_cast<std::int64_t>(ReadBigEndian(data));

    case oid::kFloat4: {
      RequireWidth(type_oid, data, 4);
      const auto bits = static_cast<std::uint32_t>(ReadBigEndian(data));
      float      f    = 0;
      std::memcpy(&f, &bits, sizeof(f));
      return static_cast<double>(f);
    }

    case oid::kFloat8: {
      RequireWidth(type_oid, data, 8);
      const auto bits = ReadBigEndian(data);
      double     d    = 0;
      std::memcpy(&d, &bits, sizeof(d));
      return d;
    }

    default:
      return std::string(data);
  }
}

} // namespace pgcdc::relation

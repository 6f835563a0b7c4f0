#pragma once

#include <cstdint>
#include <string_view>

#include "internal/model/value.hpp"

namespace pgcdc::relation {

// Built-in type OIDs from pg_type.dat that decode to something other
// than a string.
namespace oid {
inline constexpr std::uint32_t kBool   = 16;
inline constexpr std::uint32_t kBytea  = 17;
inline constexpr std::uint32_t kInt8   = 20;
inline constexpr std::uint32_t kInt2   = 21;
inline constexpr std::uint32_t kInt4   = 23;
inline constexpr std::uint32_t kOid    = 26;
inline constexpr std::uint32_t kFloat4 = 700;
inline constexpr std::uint32_t kFloat8 = 701;
} // namespace oid

// Text output format. Throws DecodeError on malformed input.
model::Value DecodeText(std::uint32_t type_oid, std::string_view text);

// Binary send format. Throws DecodeError on wrong width.
model::Value DecodeBinary(std::uint32_t type_oid, std::string_view data);

} // namespace pgcdc::relation

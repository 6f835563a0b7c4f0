#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace pgcdc::model {

/*
  Native column value.

  std::monostate is SQL NULL. Numeric and temporal types stay in their
  text form.
*/
using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

// column name -> value
using StructuredData = std::map<std::string, Value>;

inline bool IsNull(const Value& v) {
  return std::holds_alternative<std::monostate>(v);
}

} // namespace pgcdc::model

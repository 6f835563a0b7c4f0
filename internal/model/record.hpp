#pragma once

#include <map>
#include <optional>
#include <string>

#include "internal/model/value.hpp"

namespace pgcdc::model {

enum class Operation {
  kCreate,
  kUpdate,
  kDelete,
};

inline const char* ToString(Operation op) {
  switch (op) {
    case Operation::kCreate: return "create";
    case Operation::kUpdate: return "update";
    case Operation::kDelete: return "delete";
  }
  return "unknown";
}

inline constexpr const char* kMetadataCollection = "opencdc.collection";

/*
  Canonical change record.

  - key holds at most one column (single-column keys only).
  - before is set for updates when an old image was logged.
  - after is set for creates and updates.
  - an absent payload is different from an empty one.
*/
struct Record {
  Operation   operation = Operation::kCreate;
  std::string position;

  std::map<std::string, std::string> metadata;

  StructuredData                key;
  std::optional<StructuredData> before;
  std::optional<StructuredData> after;

  std::string Collection() const {
    auto it = metadata.find(kMetadataCollection);
    return it == metadata.end() ? std::string{} : it->second;
  }
};

} // namespace pgcdc::model

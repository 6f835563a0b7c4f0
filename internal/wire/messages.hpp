#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pgcdc::wire {

/*
  Typed pgoutput (protocol version 1) logical replication messages.

  Only the messages the change pipeline acts on are modelled in full;
  everything else arrives as OtherMessage carrying its type byte.
*/

enum class TupleDataKind : char {
  Null      = 'n',
  Unchanged = 'u', // TOAST value not logged
  Text      = 't',
  Binary    = 'b',
};

struct TupleColumn {
  TupleDataKind kind = TupleDataKind::Null;
  std::string   data;
};

struct TupleData {
  std::vector<TupleColumn> columns;
};

struct RelationColumn {
  static constexpr std::uint8_t kFlagKey = 1;

  std::uint8_t  flags         = 0;
  std::string   name;
  std::uint32_t type_oid      = 0;
  std::int32_t  type_modifier = -1;

  bool IsKey() const {
    return (flags & kFlagKey) != 0;
  }
};

struct RelationMessage {
  std::uint32_t               relation_id = 0;
  std::string                 namespace_name;
  std::string                 relation_name;
  std::uint8_t                replica_identity = 'd';
  std::vector<RelationColumn> columns;

  std::string QualifiedName() const {
    return namespace_name.empty() ? relation_name : namespace_name + "." + relation_name;
  }
};

struct InsertMessage {
  std::uint32_t relation_id = 0;
  TupleData     tuple;
};

struct UpdateMessage {
  std::uint32_t relation_id = 0;
  // 'K' (key only), 'O' (full old row) or 0 when no old tuple was logged
  char                     old_tuple_type = 0;
  std::optional<TupleData> old_tuple;
  TupleData                new_tuple;
};

struct DeleteMessage {
  std::uint32_t            relation_id    = 0;
  char                     old_tuple_type = 0;
  std::optional<TupleData> old_tuple;
};

struct OtherMessage {
  char type = 0;
};

using Message = std::variant<RelationMessage, InsertMessage, UpdateMessage, DeleteMessage, OtherMessage>;

// Single-letter pgoutput type of a message, for logging.
char MessageType(const Message& message);

const char* MessageTypeName(char type);

} // namespace pgcdc::wire

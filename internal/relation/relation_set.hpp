#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/model/value.hpp"
#include "internal/wire/messages.hpp"

namespace pgcdc::relation {

/*
  RelationSet

  Relation schemas announced by the replication stream, keyed by
  relation id, plus tuple decoding against them.

  Design notes:
  -------------
  - A relation message always precedes the first data message for that
    relation within a session. Looking up an unknown id is therefore a
    protocol violation (ProtocolOrderingError), never a soft miss.
  - Add() replaces the entry wholesale; schema changes arrive as a new
    relation message with the same id.
  - Not synchronized. One session owns one RelationSet and touches it
    from one thread only. Sharding a session across threads requires
    putting this behind a mutex.
*/
class RelationSet {
 public:
  void Add(const wire::RelationMessage& relation);

  // throws ProtocolOrderingError
  const wire::RelationMessage& Get(std::uint32_t relation_id) const;

  bool Contains(std::uint32_t relation_id) const {
    return relations_.contains(relation_id);
  }

  std::size_t Size() const {
    return relations_.size();
  }

  // Hard decode: throws DecodeError if the tuple is missing or any
  // column can not be produced. Null columns decode to std::monostate.
  model::StructuredData Decode(std::uint32_t relation_id, const wire::TupleData* tuple) const;

  // Soft decode for optional images (update old tuples): returns nullopt
  // and fills reason instead of throwing DecodeError. An unknown
  // relation id still throws.
  std::optional<model::StructuredData> TryDecode(std::uint32_t relation_id,
                                                 const wire::TupleData* tuple,
                                                 std::string*           reason) const;

 private:
  std::unordered_map<std::uint32_t, wire::RelationMessage> relations_;
};

} // namespace pgcdc::relation

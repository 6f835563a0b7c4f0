#include "relation_set.hpp"

#include "internal/util/errors.hpp"
#include "value_decoder.hpp"

namespace pgcdc::relation {

void RelationSet::Add(const wire::RelationMessage& relation) {
  relations_[relation.relation_id] = relation;
}

const wire::RelationMessage& RelationSet::Get(std::uint32_t relation_id) const {
  auto it = relations_.find(relation_id);
  if (it == relations_.end()) {
    throw util::ProtocolOrderingError("relation " + std::to_string(relation_id) +
                                      " not found (no relation message received for it)");
  }
  return it->second;
}

model::StructuredData RelationSet::Decode(std::uint32_t relation_id, const wire::TupleData* tuple) const {
  const auto& rel = Get(relation_id);

  if (tuple == nullptr) {
    throw util::DecodeError("no tuple provided for relation " + rel.QualifiedName());
  }

  if (tuple->columns.size() != rel.columns.size()) {
    throw util::DecodeError("tuple for relation " + rel.QualifiedName() + " has " +
                            std::to_string(tuple->columns.size()) + " columns, relation has " +
                            std::to_string(rel.columns.size()));
  }

  model::StructuredData values;
  for (std::size_t i = 0; i < tuple->columns.size(); ++i) {
    const auto& col   = rel.columns[i];
    const auto& datum = tuple->columns[i];

    switch (datum.kind) {
      case wire::TupleDataKind::Null:
        values[col.name] = std::monostate{};
        break;

      case wire::TupleDataKind::Unchanged:
        throw util::DecodeError("column \"" + col.name + "\" of " + rel.QualifiedName() +
                                " is an unchanged TOAST value and was not logged");

      case wire::TupleDataKind::Text:
        values[col.name] = DecodeText(col.type_oid, datum.data);
        break;

      case wire::TupleDataKind::Binary:
        values[col.name] = DecodeBinary(col.type_oid, datum.data);
        break;

      default:
        throw util::DecodeError("column \"" + col.name + "\" of " + rel.QualifiedName() + " has unknown data kind");
    }
  }

  return values;
}

std::optional<model::StructuredData> RelationSet::TryDecode(std::uint32_t          relation_id,
                                                            const wire::TupleData* tuple,
                                                            std::string*           reason) const {
  try {
    return Decode(relation_id, tuple);
  } catch (const util::DecodeError& e) {
    if (reason != nullptr) {
      *reason = e.what();
    }
    return std::nullopt;
  }
}

} // namespace pgcdc::relation

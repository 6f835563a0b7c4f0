#include "cdc_handler.hpp"

#include <string_view>

#include "internal/cdc/position.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pgcdc::cdc {

using observability::IntField;
using observability::LsnField;
using observability::StringField;

namespace {

// Re-throws handler errors with the failing operation prepended, keeping
// their type. Cancellation propagates untouched.
template <typename Fn>
void WithContext(std::string_view operation, Fn&& fn) {
  const auto prefix = "handler " + std::string(operation) + ": ";
  try {
    fn();
  } catch (const util::Cancelled&) {
    throw;
  } catch (const util::ProtocolOrderingError& e) {
    throw util::ProtocolOrderingError(prefix + e.what());
  } catch (const util::DecodeError& e) {
    throw util::DecodeError(prefix + e.what());
  }
}

} // namespace

CdcHandler::CdcHandler(std::shared_ptr<relation::RelationSet> relations,
                       TableKeys                              table_keys,
                       std::shared_ptr<RecordChannel>         out)
    : relations_(std::move(relations)), table_keys_(std::move(table_keys)), out_(std::move(out)) {
}

void CdcHandler::Handle(const wire::Message& message, util::Lsn lsn, util::CancellationToken& token) {
  // nothing is applied once the session is cancelled, schema changes included
  token.ThrowIfCancelled();

  const char type = wire::MessageType(message);
  PGCDC_LOG_TRACE("handler received message",
                  {LsnField("lsn", lsn), StringField("message_type", wire::MessageTypeName(type))});

  if (const auto* rel = std::get_if<wire::RelationMessage>(&message)) {
    // later data messages are decoded against this schema
    relations_->Add(*rel);
    PGCDC_LOG_DEBUG("relation registered",
                    {IntField("relation_id", rel->relation_id), StringField("relation", rel->QualifiedName()),
                     IntField("columns", static_cast<std::int64_t>(rel->columns.size()))});
    return;
  }

  if (const auto* ins = std::get_if<wire::InsertMessage>(&message)) {
    WithContext("insert", [&] { HandleInsert(*ins, lsn, token); });
    return;
  }

  if (const auto* upd = std::get_if<wire::UpdateMessage>(&message)) {
    WithContext("update", [&] { HandleUpdate(*upd, lsn, token); });
    return;
  }

  if (const auto* del = std::get_if<wire::DeleteMessage>(&message)) {
    WithContext("delete", [&] { HandleDelete(*del, lsn, token); });
    return;
  }

  // begin, commit, origin, type, truncate ... are not turned into records
}

void CdcHandler::HandleInsert(const wire::InsertMessage& msg, util::Lsn lsn, util::CancellationToken& token) {
  const auto& rel = relations_->Get(msg.relation_id);

  model::StructuredData new_values;
  try {
    new_values = relations_->Decode(msg.relation_id, &msg.tuple);
  } catch (const util::DecodeError& e) {
    throw util::DecodeError(std::string("failed to decode new values: ") + e.what());
  }

  model::Record rec;
  rec.operation = model::Operation::kCreate;
  rec.position  = BuildPosition(lsn);
  rec.metadata  = BuildMetadata(rel);
  rec.key       = BuildKey(new_values, rel.relation_name);
  rec.after     = BuildPayload(new_values);

  Send(std::move(rec), token);
}

void CdcHandler::HandleUpdate(const wire::UpdateMessage& msg, util::Lsn lsn, util::CancellationToken& token) {
  const auto& rel = relations_->Get(msg.relation_id);

  model::StructuredData new_values;
  try {
    new_values = relations_->Decode(msg.relation_id, &msg.new_tuple);
  } catch (const util::DecodeError& e) {
    throw util::DecodeError(std::string("failed to decode new values: ") + e.what());
  }

  std::string reason;
  const auto  old_values =
      relations_->TryDecode(msg.relation_id, msg.old_tuple ? &*msg.old_tuple : nullptr, &reason);
  if (!old_values) {
    // old values are optional; trace keeps production logs quiet
    PGCDC_LOG_TRACE("could not parse old values from update message",
                    {StringField("relation", rel.QualifiedName()), StringField("error", reason)});
  }

  model::Record rec;
  rec.operation = model::Operation::kUpdate;
  rec.position  = BuildPosition(lsn);
  rec.metadata  = BuildMetadata(rel);
  rec.key       = BuildKey(new_values, rel.relation_name);
  rec.before    = BuildPayload(old_values);
  rec.after     = BuildPayload(new_values);

  Send(std::move(rec), token);
}

void CdcHandler::HandleDelete(const wire::DeleteMessage& msg, util::Lsn lsn, util::CancellationToken& token) {
  const auto& rel = relations_->Get(msg.relation_id);

  model::StructuredData old_values;
  try {
    old_values = relations_->Decode(msg.relation_id, msg.old_tuple ? &*msg.old_tuple : nullptr);
  } catch (const util::DecodeError& e) {
    throw util::DecodeError(std::string("failed to decode old values: ") + e.what());
  }

  // deletes carry only the key
  model::Record rec;
  rec.operation = model::Operation::kDelete;
  rec.position  = BuildPosition(lsn);
  rec.metadata  = BuildMetadata(rel);
  rec.key       = BuildKey(old_values, rel.relation_name);

  Send(std::move(rec), token);
}

void CdcHandler::Send(model::Record record, util::CancellationToken& token) {
  out_->Send(std::move(record), token);
}

std::map<std::string, std::string> CdcHandler::BuildMetadata(const wire::RelationMessage& relation) const {
  return {{model::kMetadataCollection, relation.relation_name}};
}

model::StructuredData CdcHandler::BuildKey(const model::StructuredData& values, const std::string& table) const {
  model::StructuredData key;

  auto key_column = table_keys_.find(table);
  if (key_column == table_keys_.end()) {
    PGCDC_LOG_DEBUG("no key column configured", {StringField("table", table)});
    return key;
  }

  // single-column keys only
  auto it = values.find(key_column->second);
  if (it == values.end()) {
    PGCDC_LOG_DEBUG("key column missing from decoded values",
                    {StringField("table", table), StringField("column", key_column->second)});
    return key;
  }

  key.emplace(it->first, it->second);
  return key;
}

std::optional<model::StructuredData> CdcHandler::BuildPayload(
    const std::optional<model::StructuredData>& values) const {
  if (!values || values->empty()) {
    return std::nullopt;
  }
  return values;
}

std::string CdcHandler::BuildPosition(util::Lsn lsn) {
  if (last_lsn_ && lsn < *last_lsn_) {
    PGCDC_LOG_WARN("lsn moved backwards",
                   {LsnField("previous", *last_lsn_), LsnField("lsn", lsn)});
  }
  last_lsn_ = lsn;
  return PositionCodec::Encode(lsn);
}

} // namespace pgcdc::cdc

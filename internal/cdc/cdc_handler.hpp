#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "internal/model/record.hpp"
#include "internal/relation/relation_set.hpp"
#include "internal/util/bounded_channel.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/lsn.hpp"
#include "internal/wire/messages.hpp"

namespace pgcdc::cdc {

using RecordChannel = util::BoundedChannel<model::Record>;

/*
  CdcHandler

  Turns logical replication messages into Records and pushes them to the
  output channel, one message at a time, in arrival order.

  - Relation messages refresh the RelationSet.
  - Insert/Update/Delete become create/update/delete records.
  - Everything else is ignored.

  Failures to decode a new tuple (insert, update) or the old tuple of a
  delete are fatal for the message. A missing or undecodable old tuple
  on update only drops the before-image.

  Cancellation is checked before any message is applied and again while
  blocked on the send, the only blocking point.
*/
class CdcHandler {
 public:
  // table name -> key column
  using TableKeys = std::map<std::string, std::string>;

  CdcHandler(std::shared_ptr<relation::RelationSet> relations,
             TableKeys                              table_keys,
             std::shared_ptr<RecordChannel>         out);

  // throws ProtocolOrderingError, DecodeError, Cancelled
  void Handle(const wire::Message& message, util::Lsn lsn, util::CancellationToken& token);

 private:
  void HandleInsert(const wire::InsertMessage& msg, util::Lsn lsn, util::CancellationToken& token);
  void HandleUpdate(const wire::UpdateMessage& msg, util::Lsn lsn, util::CancellationToken& token);
  void HandleDelete(const wire::DeleteMessage& msg, util::Lsn lsn, util::CancellationToken& token);

  void Send(model::Record record, util::CancellationToken& token);

  std::map<std::string, std::string> BuildMetadata(const wire::RelationMessage& relation) const;
  model::StructuredData              BuildKey(const model::StructuredData& values, const std::string& table) const;
  std::optional<model::StructuredData> BuildPayload(const std::optional<model::StructuredData>& values) const;
  std::string                          BuildPosition(util::Lsn lsn);

  std::shared_ptr<relation::RelationSet> relations_;
  TableKeys                              table_keys_;
  std::shared_ptr<RecordChannel>         out_;

  std::optional<util::Lsn> last_lsn_;
};

} // namespace pgcdc::cdc

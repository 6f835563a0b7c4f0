#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

#include "internal/cdc/cdc_handler.hpp"

namespace pgcdc::runtime::config {
class SourceConfig;
}

namespace pgcdc::cdc {

/*
  One logical replication session: a RelationSet, the handler that owns
  it and the channel records leave through.

  The connection layer calls Deliver() with each XLogData payload and its
  WAL start LSN, in the order the server sent them. Consumers read from
  Records() on any thread.
*/
class CdcSession {
 public:
  static constexpr std::size_t kDefaultChannelCapacity = 1000;

  explicit CdcSession(const pgcdc::runtime::config::SourceConfig& config);

  CdcSession(CdcHandler::TableKeys table_keys, std::size_t channel_capacity);

  CdcSession(const CdcSession&)            = delete;
  CdcSession& operator=(const CdcSession&) = delete;

  // throws DecodeError, ProtocolOrderingError, Cancelled
  void Deliver(std::string_view xlog_data, util::Lsn lsn, util::CancellationToken& token);

  void Deliver(const wire::Message& message, util::Lsn lsn, util::CancellationToken& token);

  // no more messages; consumers drain what is buffered
  void Close();

  RecordChannel& Records() {
    return *records_;
  }

  const relation::RelationSet& Relations() const {
    return *relations_;
  }

 private:
  std::shared_ptr<relation::RelationSet> relations_;
  std::shared_ptr<RecordChannel>         records_;
  std::unique_ptr<CdcHandler>            handler_;
};

} // namespace pgcdc::cdc

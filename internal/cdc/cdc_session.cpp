#include "cdc_session.hpp"

#include "config/config.pb.h"
#include "internal/wire/pgoutput_parser.hpp"

namespace pgcdc::cdc {

namespace {

CdcHandler::TableKeys ToTableKeys(const pgcdc::runtime::config::SourceConfig& config) {
  CdcHandler::TableKeys keys;
  for (const auto& [table, column] : config.table_keys()) {
    keys.emplace(table, column);
  }
  return keys;
}

} // namespace

CdcSession::CdcSession(const pgcdc::runtime::config::SourceConfig& config)
    : CdcSession(ToTableKeys(config),
                 config.channel_capacity() == 0 ? kDefaultChannelCapacity : config.channel_capacity()) {
}

CdcSession::CdcSession(CdcHandler::TableKeys table_keys, std::size_t channel_capacity)
    : relations_(std::make_shared<relation::RelationSet>()),
      records_(std::make_shared<RecordChannel>(channel_capacity)),
      handler_(std::make_unique<CdcHandler>(relations_, std::move(table_keys), records_)) {
}

void CdcSession::Deliver(std::string_view xlog_data, util::Lsn lsn, util::CancellationToken& token) {
  Deliver(wire::ParseMessage(xlog_data), lsn, token);
}

void CdcSession::Deliver(const wire::Message& message, util::Lsn lsn, util::CancellationToken& token) {
  handler_->Handle(message, lsn, token);
}

void CdcSession::Close() {
  records_->Close();
}

} // namespace pgcdc::cdc

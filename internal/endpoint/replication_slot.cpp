#include "replication_slot.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pgcdc::endpoint {

using observability::StringField;

void CreateReplicationSlot(db::Connection& conn, const std::string& name) {
  try {
    conn.Execute("SELECT pg_create_logical_replication_slot($1, $2)", {name, kOutputPlugin});
  } catch (const util::UpstreamError& e) {
    throw util::UpstreamError("failed to create replication slot \"" + name + "\": " + e.what());
  }

  PGCDC_LOG_INFO("replication slot created", {StringField("slot", name), StringField("plugin", kOutputPlugin)});
}

void DropReplicationSlot(db::Connection& conn, const std::string& name) {
  try {
    conn.Execute("SELECT pg_drop_replication_slot($1)", {name});
  } catch (const util::UpstreamError& e) {
    throw util::UpstreamError("failed to drop replication slot \"" + name + "\": " + e.what());
  }

  PGCDC_LOG_INFO("replication slot dropped", {StringField("slot", name)});
}

} // namespace pgcdc::endpoint

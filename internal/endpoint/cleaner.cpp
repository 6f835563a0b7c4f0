#include "cleaner.hpp"

#include <vector>

#include "internal/endpoint/publication.hpp"
#include "internal/endpoint/replication_slot.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pgcdc::endpoint {

using observability::StringField;

namespace {

bool HasWork(const EndpointConfig& config) {
  return config.slot_name.has_value() || config.publication_name.has_value();
}

std::unique_ptr<db::Connection> Open(const EndpointConfig& config, const ConnectionFactory& connect) {
  auto conn = connect(config.url);
  if (!conn) {
    throw util::UpstreamError("failed to open connection for endpoint management");
  }
  return conn;
}

} // namespace

void Cleanup(const EndpointConfig& config, const ConnectionFactory& connect) {
  if (!HasWork(config)) {
    PGCDC_LOG_DEBUG("cleanup: nothing to drop");
    return;
  }

  auto conn = Open(config, connect);
  Cleanup(config, *conn);
}

void Cleanup(const EndpointConfig& config, db::Connection& conn) {
  std::vector<std::string> errors;

  if (config.publication_name) {
    try {
      DropPublicationOptions options;
      options.if_exists = true;
      DropPublication(conn, *config.publication_name, options);
    } catch (const util::UpstreamError& e) {
      PGCDC_LOG_WARN("cleanup: publication drop failed",
                     {StringField("publication", *config.publication_name), StringField("error", e.what())});
      errors.emplace_back(e.what());
    }
  }

  if (config.slot_name) {
    try {
      DropReplicationSlot(conn, *config.slot_name);
    } catch (const util::UpstreamError& e) {
      PGCDC_LOG_WARN("cleanup: replication slot drop failed",
                     {StringField("slot", *config.slot_name), StringField("error", e.what())});
      errors.emplace_back(e.what());
    }
  }

  if (errors.empty()) {
    return;
  }

  std::string joined;
  for (const auto& err : errors) {
    if (!joined.empty()) joined += "\n";
    joined += err;
  }
  throw util::UpstreamError(joined);
}

void Setup(const EndpointConfig& config, const ConnectionFactory& connect) {
  if (!HasWork(config)) {
    PGCDC_LOG_DEBUG("setup: nothing to create");
    return;
  }

  auto conn = Open(config, connect);
  Setup(config, *conn);
}

void Setup(const EndpointConfig& config, db::Connection& conn) {
  if (config.publication_name) {
    CreatePublicationOptions options;
    options.tables             = config.tables;
    options.publication_params = config.publication_params;
    CreatePublication(conn, *config.publication_name, options);
  }

  if (config.slot_name) {
    CreateReplicationSlot(conn, *config.slot_name);
  }
}

} // namespace pgcdc::endpoint

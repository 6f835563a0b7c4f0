#include "endpoint_config.hpp"

#include "config/config.pb.h"

namespace pgcdc::endpoint {

EndpointConfig EndpointConfig::FromSource(const pgcdc::runtime::config::SourceConfig& source) {
  EndpointConfig config;
  config.url = source.url();
  if (!source.slot_name().empty()) {
    config.slot_name = source.slot_name();
  }
  if (!source.publication_name().empty()) {
    config.publication_name = source.publication_name();
  }
  config.tables.assign(source.tables().begin(), source.tables().end());
  config.publication_params.assign(source.publication_params().begin(), source.publication_params().end());
  return config;
}

} // namespace pgcdc::endpoint

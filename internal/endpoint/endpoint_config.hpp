#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pgcdc::runtime::config {
class SourceConfig;
}

namespace pgcdc::endpoint {

/*
  Replication endpoints managed for a session.

  Slot and publication are independently optional: an externally managed
  slot may be paired with a publication this process owns, and the other
  way round.
*/
struct EndpointConfig {
  std::string                url;
  std::optional<std::string> slot_name;
  std::optional<std::string> publication_name;
  std::vector<std::string>   tables;
  std::vector<std::string>   publication_params;

  // empty names in the config mean "not managed"
  static EndpointConfig FromSource(const pgcdc::runtime::config::SourceConfig& source);
};

} // namespace pgcdc::endpoint

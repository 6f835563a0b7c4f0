#pragma once

#include <string>
#include <vector>

#include "internal/db/api/connection.hpp"

namespace pgcdc::endpoint {

struct CreatePublicationOptions {
  std::vector<std::string> tables;
  // raw WITH (...) fragments, e.g. "publish = 'insert, update'"
  std::vector<std::string> publication_params;
};

struct DropPublicationOptions {
  bool if_exists = false;
};

// Throws ConfigurationError before touching the connection when no table
// is given; UpstreamError if the statement fails (e.g. already exists).
void CreatePublication(db::Connection& conn, const std::string& name, const CreatePublicationOptions& options);

// With if_exists a missing publication is not an error.
void DropPublication(db::Connection& conn, const std::string& name, const DropPublicationOptions& options);

// "name" with embedded quotes doubled
std::string QuoteIdentifier(const std::string& name);

} // namespace pgcdc::endpoint

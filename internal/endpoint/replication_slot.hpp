#pragma once

#include <string>

#include "internal/db/api/connection.hpp"

namespace pgcdc::endpoint {

inline constexpr const char* kOutputPlugin = "pgoutput";

// Logical slot decoding with pgoutput. UpstreamError if it already exists.
void CreateReplicationSlot(db::Connection& conn, const std::string& name);

// No IF EXISTS variant: a missing slot is always an UpstreamError
// carrying the server's "replication slot ... does not exist".
void DropReplicationSlot(db::Connection& conn, const std::string& name);

} // namespace pgcdc::endpoint

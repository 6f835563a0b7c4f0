#pragma once

#include <functional>
#include <memory>
#include <string>

#include "internal/db/api/connection.hpp"
#include "internal/endpoint/endpoint_config.hpp"

namespace pgcdc::endpoint {

using ConnectionFactory = std::function<std::unique_ptr<db::Connection>(const std::string& url)>;

/*
  Cleanup

  Tears down the endpoints named in config, publication first:

  1. publication_name set: DROP PUBLICATION IF EXISTS. A missing
     publication is a no-op.
  2. slot_name set: pg_drop_replication_slot. Slots have no IF EXISTS,
     so a missing slot fails with `replication slot "<name>" does not
     exist`.

  The asymmetry mirrors PostgreSQL and is kept on purpose: a slot that
  vanished is worth reporting (WAL retention was lost), a publication
  that is already gone is not.

  Step 2 runs even if step 1 failed; all failures are joined into one
  UpstreamError, so a publication problem never hides a slot problem.
  With neither name set nothing happens and no connection is opened.
*/
void Cleanup(const EndpointConfig& config, const ConnectionFactory& connect);

// Same, on an already open connection.
void Cleanup(const EndpointConfig& config, db::Connection& conn);

// Creates the publication (if named) then the slot (if named).
void Setup(const EndpointConfig& config, const ConnectionFactory& connect);

void Setup(const EndpointConfig& config, db::Connection& conn);

} // namespace pgcdc::endpoint

#pragma once

#include <string>
#include <vector>

namespace pgcdc::db {

/*
  Minimal SQL execution seam.

  Endpoint DDL runs through this so it can be exercised without a server.
  Implementations run each statement on its own (no explicit transaction;
  replication slot functions refuse to run inside one that has written)
  and report every server or connection failure as util::UpstreamError
  carrying the server message.
*/
class Connection {
 public:
  virtual ~Connection() = default;

  // $1..$n placeholders are bound to params in order
  virtual void Execute(const std::string& sql, const std::vector<std::string>& params = {}) = 0;
};

} // namespace pgcdc::db

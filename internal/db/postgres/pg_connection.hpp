#pragma once

#include <memory>
#include <pqxx/pqxx>
#include <string>
#include <vector>

#include "internal/db/api/connection.hpp"

namespace pgcdc::db::postgres {

/*
  PgConnection

  libpqxx-backed Connection. Owns one pqxx::connection; like any libpqxx
  connection it must not be shared across threads.
*/
class PgConnection final : public db::Connection {
 public:
  // throws UpstreamError if the server can not be reached
  explicit PgConnection(const std::string& conninfo);

  void Execute(const std::string& sql, const std::vector<std::string>& params = {}) override;

 private:
  std::unique_ptr<pqxx::connection> conn_;
};

// endpoint::ConnectionFactory backed by libpqxx
std::unique_ptr<db::Connection> Connect(const std::string& conninfo);

} // namespace pgcdc::db::postgres

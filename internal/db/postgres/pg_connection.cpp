#include "pg_connection.hpp"

#include "internal/util/errors.hpp"

namespace pgcdc::db::postgres {

PgConnection::PgConnection(const std::string& conninfo) {
  try {
    conn_ = std::make_unique<pqxx::connection>(conninfo);
  } catch (const std::exception& e) {
    throw util::UpstreamError(std::string("failed to connect to database: ") + e.what());
  }
}

void PgConnection::Execute(const std::string& sql, const std::vector<std::string>& params) {
  try {
    pqxx::nontransaction tx(*conn_);

    pqxx::params bound;
    for (const auto& p : params) {
      bound.append(p);
    }
    tx.exec_params(sql, bound);
  } catch (const std::exception& e) {
    // keep the server's wording, callers match on it
    throw util::UpstreamError(e.what());
  }
}

std::unique_ptr<db::Connection> Connect(const std::string& conninfo) {
  return std::make_unique<PgConnection>(conninfo);
}

} // namespace pgcdc::db::postgres

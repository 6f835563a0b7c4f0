#pragma once

#include <set>
#include <string>
#include <vector>

#include "internal/db/api/connection.hpp"
#include "internal/util/errors.hpp"

namespace pgcdc::testing {

/*
  In-memory stand-in for a PostgreSQL server that understands exactly
  the statements the endpoint code issues, and fails them with the
  server's own wording.
*/
class FakeConnection final : public db::Connection {
 public:
  struct Statement {
    std::string              sql;
    std::vector<std::string> params;
  };

  void Execute(const std::string& sql, const std::vector<std::string>& params = {}) override {
    executed.push_back({sql, params});

    if (!fail_with.empty()) {
      throw util::UpstreamError(fail_with);
    }

    if (StartsWith(sql, "CREATE PUBLICATION ")) {
      const auto name = QuotedName(sql);
      if (!publications.insert(name).second) {
        throw util::UpstreamError("ERROR:  publication \"" + name + "\" already exists");
      }
      return;
    }

    if (StartsWith(sql, "DROP PUBLICATION IF EXISTS ")) {
      publications.erase(QuotedName(sql));
      return;
    }

    if (StartsWith(sql, "DROP PUBLICATION ")) {
      const auto name = QuotedName(sql);
      if (publications.erase(name) == 0) {
        throw util::UpstreamError("ERROR:  publication \"" + name + "\" does not exist");
      }
      return;
    }

    if (sql == "SELECT pg_create_logical_replication_slot($1, $2)") {
      if (!slots.insert(params.at(0)).second) {
        throw util::UpstreamError("ERROR:  replication slot \"" + params.at(0) + "\" already exists");
      }
      return;
    }

    if (sql == "SELECT pg_drop_replication_slot($1)") {
      if (slots.erase(params.at(0)) == 0) {
        throw util::UpstreamError("ERROR:  replication slot \"" + params.at(0) + "\" does not exist");
      }
      return;
    }

    throw util::UpstreamError("ERROR:  syntax error in \"" + sql + "\"");
  }

  std::set<std::string>  publications;
  std::set<std::string>  slots;
  std::vector<Statement> executed;

  // non-empty: every statement fails with this message
  std::string fail_with;

 private:
  static bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
  }

  static std::string QuotedName(const std::string& sql) {
    const auto open  = sql.find('"');
    const auto close = sql.find('"', open + 1);
    return sql.substr(open + 1, close - open - 1);
  }
};

} // namespace pgcdc::testing

#include "publication.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pgcdc::endpoint {

using observability::IntField;
using observability::StringField;

namespace {

std::string Join(const std::vector<std::string>& parts, const char* sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += sep;
    out += parts[i];
  }
  return out;
}

} // namespace

std::string QuoteIdentifier(const std::string& name) {
  std::string out = "\"";
  for (char c : name) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

void CreatePublication(db::Connection& conn, const std::string& name, const CreatePublicationOptions& options) {
  if (options.tables.empty()) {
    throw util::ConfigurationError("publication \"" + name + "\" requires at least one table");
  }

  std::string sql = "CREATE PUBLICATION " + QuoteIdentifier(name) + " FOR TABLE " + Join(options.tables, ", ");
  if (!options.publication_params.empty()) {
    sql += " WITH (" + Join(options.publication_params, ", ") + ")";
  }

  try {
    conn.Execute(sql);
  } catch (const util::UpstreamError& e) {
    throw util::UpstreamError("failed to create publication \"" + name + "\": " + e.what());
  }

  PGCDC_LOG_INFO("publication created",
                 {StringField("publication", name), IntField("tables", static_cast<std::int64_t>(options.tables.size()))});
}

void DropPublication(db::Connection& conn, const std::string& name, const DropPublicationOptions& options) {
  std::string sql = "DROP PUBLICATION ";
  if (options.if_exists) {
    sql += "IF EXISTS ";
  }
  sql += QuoteIdentifier(name);

  try {
    conn.Execute(sql);
  } catch (const util::UpstreamError& e) {
    throw util::UpstreamError("failed to drop publication \"" + name + "\": " + e.what());
  }

  PGCDC_LOG_INFO("publication dropped", {StringField("publication", name)});
}

} // namespace pgcdc::endpoint

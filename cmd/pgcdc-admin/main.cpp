#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/postgres/pg_connection.hpp"
#include "internal/endpoint/cleaner.hpp"
#include "internal/endpoint/endpoint_config.hpp"
#include "internal/observability/logging.hpp"

using pgcdc::endpoint::EndpointConfig;
using pgcdc::observability::StringField;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  pgcdc-admin <config.yaml> <setup|cleanup>\n"
            << "  pgcdc-admin --config <config.yaml> <setup|cleanup>\n";
}

int main(int argc, char** argv) {
  std::string config_path;
  std::string command;
  if (argc == 3) {
    config_path = argv[1];
    command     = argv[2];
  } else if (argc == 4 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
    command     = argv[3];
  } else {
    Usage();
    return 1;
  }

  if (command != "setup" && command != "cleanup") {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = pgcdc::config::ConfigLoader::LoadFromYaml(config_path);
    pgcdc::observability::InitializeLogging(config.logging());

    const auto endpoints = EndpointConfig::FromSource(config.source());

    // ------------------------------------------------------------
    // Run
    // ------------------------------------------------------------
    if (command == "setup") {
      pgcdc::endpoint::Setup(endpoints, pgcdc::db::postgres::Connect);
    } else {
      pgcdc::endpoint::Cleanup(endpoints, pgcdc::db::postgres::Connect);
    }

    PGCDC_LOG_INFO("done", {StringField("command", command)});
    pgcdc::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    PGCDC_LOG_ERROR("Fatal error", {StringField("command", command), StringField("error", e.what())});
    pgcdc::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}

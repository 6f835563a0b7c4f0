#include "internal/endpoint/publication.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/endpoint/replication_slot.hpp"
#include "internal/util/errors.hpp"
#include "support/fake_connection.hpp"

namespace {

using pgcdc::endpoint::CreatePublication;
using pgcdc::endpoint::CreatePublicationOptions;
using pgcdc::endpoint::CreateReplicationSlot;
using pgcdc::endpoint::DropPublication;
using pgcdc::endpoint::DropPublicationOptions;
using pgcdc::endpoint::DropReplicationSlot;
using pgcdc::endpoint::QuoteIdentifier;
using pgcdc::testing::FakeConnection;

template <typename E, typename Fn>
std::string CatchMessage(Fn&& fn) {
  try {
    fn();
  } catch (const E& e) {
    return e.what();
  }
  return {};
}

void TestCreatePublicationWithoutTablesFailsBeforeSql() {
  FakeConnection conn;

  const auto msg = CatchMessage<pgcdc::util::ConfigurationError>(
      [&] { CreatePublication(conn, "p", CreatePublicationOptions{}); });

  assert(msg == "publication \"p\" requires at least one table");
  assert(conn.executed.empty());
}

void TestCreatePublicationStatement() {
  FakeConnection           conn;
  CreatePublicationOptions options;
  options.tables = {"users", "public.orders"};
  CreatePublication(conn, "pub", options);

  assert(conn.executed.size() == 1);
  assert(conn.executed[0].sql == "CREATE PUBLICATION \"pub\" FOR TABLE users, public.orders");
  assert(conn.publications.contains("pub"));

  FakeConnection with_params;
  options.publication_params = {"publish = 'insert,update'", "publish_via_partition_root = true"};
  CreatePublication(with_params, "pub", options);
  assert(with_params.executed[0].sql ==
         "CREATE PUBLICATION \"pub\" FOR TABLE users, public.orders "
         "WITH (publish = 'insert,update', publish_via_partition_root = true)");
}

void TestCreateExistingPublicationIsUpstreamError() {
  FakeConnection conn;
  conn.publications.insert("pub");

  CreatePublicationOptions options;
  options.tables = {"users"};
  const auto msg = CatchMessage<pgcdc::util::UpstreamError>([&] { CreatePublication(conn, "pub", options); });
  assert(msg.find("failed to create publication \"pub\"") != std::string::npos);
  assert(msg.find("already exists") != std::string::npos);
}

void TestDropPublicationIfExists() {
  FakeConnection conn;

  DropPublicationOptions if_exists;
  if_exists.if_exists = true;
  DropPublication(conn, "missing", if_exists);
  assert(conn.executed[0].sql == "DROP PUBLICATION IF EXISTS \"missing\"");

  const auto msg = CatchMessage<pgcdc::util::UpstreamError>(
      [&] { DropPublication(conn, "missing", DropPublicationOptions{}); });
  assert(msg.find("publication \"missing\" does not exist") != std::string::npos);
  assert(conn.executed[1].sql == "DROP PUBLICATION \"missing\"");
}

void TestSlotCreateAndStrictDrop() {
  FakeConnection conn;
  CreateReplicationSlot(conn, "slot");
  assert(conn.slots.contains("slot"));
  assert(conn.executed[0].params.size() == 2);
  assert(conn.executed[0].params[1] == "pgoutput");

  assert(!CatchMessage<pgcdc::util::UpstreamError>([&] { CreateReplicationSlot(conn, "slot"); }).empty());

  DropReplicationSlot(conn, "slot");
  assert(conn.slots.empty());

  const auto msg = CatchMessage<pgcdc::util::UpstreamError>([&] { DropReplicationSlot(conn, "slot"); });
  assert(msg.find("replication slot \"slot\" does not exist") != std::string::npos);
}

void TestQuoteIdentifier() {
  assert(QuoteIdentifier("pub") == "\"pub\"");
  assert(QuoteIdentifier("we\"ird") == "\"we\"\"ird\"");
}

} // namespace

int main() {
  TestCreatePublicationWithoutTablesFailsBeforeSql();
  TestCreatePublicationStatement();
  TestCreateExistingPublicationIsUpstreamError();
  TestDropPublicationIfExists();
  TestSlotCreateAndStrictDrop();
  TestQuoteIdentifier();

  std::cout << "pgcdc_unit_publication: pass\n";
  return 0;
}

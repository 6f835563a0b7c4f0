#include "internal/wire/pgoutput_parser.hpp"

#include <cassert>
#include <iostream>
#include <variant>

#include "internal/relation/value_decoder.hpp"
#include "internal/util/errors.hpp"
#include "support/pgoutput_builder.hpp"

namespace {

using pgcdc::testing::PgoutputBuilder;
using namespace pgcdc::wire;
namespace oid = pgcdc::relation::oid;

void TestRelationMessage() {
  const auto bytes = PgoutputBuilder::Relation(
      16384, "public", "users", {{"id", oid::kInt4, true}, {"name", 25, false}});

  const auto msg = ParseMessage(bytes);
  const auto* rel = std::get_if<RelationMessage>(&msg);
  assert(rel != nullptr);
  assert(rel->relation_id == 16384);
  assert(rel->namespace_name == "public");
  assert(rel->relation_name == "users");
  assert(rel->QualifiedName() == "public.users");
  assert(rel->columns.size() == 2);
  assert(rel->columns[0].name == "id");
  assert(rel->columns[0].IsKey());
  assert(rel->columns[0].type_oid == oid::kInt4);
  assert(rel->columns[0].type_modifier == -1);
  assert(!rel->columns[1].IsKey());
  assert(MessageType(msg) == 'R');
}

void TestInsertMessageKeepsColumnKinds() {
  const auto bytes = PgoutputBuilder::Insert(
      7, {PgoutputBuilder::Text("42"), PgoutputBuilder::Null(), PgoutputBuilder::Unchanged()});

  const auto msg = ParseMessage(bytes);
  const auto* ins = std::get_if<InsertMessage>(&msg);
  assert(ins != nullptr);
  assert(ins->relation_id == 7);
  assert(ins->tuple.columns.size() == 3);
  assert(ins->tuple.columns[0].kind == TupleDataKind::Text);
  assert(ins->tuple.columns[0].data == "42");
  assert(ins->tuple.columns[1].kind == TupleDataKind::Null);
  assert(ins->tuple.columns[2].kind == TupleDataKind::Unchanged);
}

void TestUpdateWithAndWithoutOldTuple() {
  {
    const auto msg = ParseMessage(PgoutputBuilder::Update(7, std::nullopt, {PgoutputBuilder::Text("1")}));
    const auto* upd = std::get_if<UpdateMessage>(&msg);
    assert(upd != nullptr);
    assert(!upd->old_tuple.has_value());
    assert(upd->old_tuple_type == 0);
    assert(upd->new_tuple.columns.size() == 1);
  }
  {
    const auto msg = ParseMessage(
        PgoutputBuilder::Update(7, std::vector<PgoutputBuilder::Datum>{PgoutputBuilder::Text("0")},
                                {PgoutputBuilder::Text("1")}));
    const auto* upd = std::get_if<UpdateMessage>(&msg);
    assert(upd != nullptr);
    assert(upd->old_tuple_type == 'O');
    assert(upd->old_tuple->columns[0].data == "0");
    assert(upd->new_tuple.columns[0].data == "1");
  }
}

void TestDeleteMessage() {
  const auto msg = ParseMessage(PgoutputBuilder::Delete(9, {PgoutputBuilder::Text("5")}));
  const auto* del = std::get_if<DeleteMessage>(&msg);
  assert(del != nullptr);
  assert(del->relation_id == 9);
  assert(del->old_tuple_type == 'K');
  assert(del->old_tuple->columns[0].data == "5");
}

void TestUnmodelledMessagesAreOther() {
  const auto msg = ParseMessage(PgoutputBuilder::Begin());
  const auto* other = std::get_if<OtherMessage>(&msg);
  assert(other != nullptr);
  assert(other->type == 'B');
  assert(std::string(MessageTypeName(MessageType(msg))) == "Begin");
}

void TestTruncatedInputIsRejected() {
  auto bytes = PgoutputBuilder::Insert(7, {PgoutputBuilder::Text("hello")});
  bytes.resize(bytes.size() - 2);

  bool threw = false;
  try {
    (void)ParseMessage(bytes);
  } catch (const pgcdc::util::DecodeError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)ParseMessage("");
  } catch (const pgcdc::util::DecodeError&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownColumnKindIsRejected() {
  auto bytes = PgoutputBuilder::Insert(7, {PgoutputBuilder::Null()});
  bytes.back() = 'x';

  bool threw = false;
  try {
    (void)ParseMessage(bytes);
  } catch (const pgcdc::util::DecodeError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRelationMessage();
  TestInsertMessageKeepsColumnKinds();
  TestUpdateWithAndWithoutOldTuple();
  TestDeleteMessage();
  TestUnmodelledMessagesAreOther();
  TestTruncatedInputIsRejected();
  TestUnknownColumnKindIsRejected();

  std::cout << "pgcdc_unit_pgoutput_parser: pass\n";
  return 0;
}

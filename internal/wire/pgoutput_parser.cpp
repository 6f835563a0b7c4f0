#include "pgoutput_parser.hpp"

#include "internal/util/errors.hpp"

namespace pgcdc::wire {

void PgoutputReader::Require(std::size_t n) const {
  if (offset_ > data_.size() || data_.size() - offset_ < n) {
    throw util::DecodeError("pgoutput message truncated at offset " + std::to_string(offset_) + " (need " +
                            std::to_string(n) + " bytes, have " + std::to_string(data_.size() - offset_) + ")");
  }
}

std::uint8_t PgoutputReader::ReadUInt8() {
  Require(1);
  return static_cast<std::uint8_t>(data_[offset_++]);
}

std::int16_t PgoutputReader::ReadInt16() {
  Require(2);
  std::uint16_t v = 0;
  for (int i = 0; i < 2; ++i) {
    v = static_cast<std::uint16_t>((v << 8) | static_cast<std::uint8_t>(data_[offset_++]));
  }
  return static_cast<std::int16_t>(v);
}

std::uint32_t PgoutputReader::ReadUInt32() {
  Require(4);
  std::uint32_t v = 0;
  for (int i = 0; i < 4; ++i) {
    v = (v << 8) | static_cast<std::uint8_t>(data_[offset_++]);
  }
  return v;
}

std::int32_t PgoutputReader::ReadInt32() {
  return static_cast<std::int32_t>(ReadUInt32());
}

std::string PgoutputReader::ReadString() {
  const auto end = data_.find('\0', offset_);
  if (end == std::string_view::npos) {
    throw util::DecodeError("pgoutput string at offset " + std::to_string(offset_) + " is not terminated");
  }

  std::string s(data_.substr(offset_, end - offset_));
  offset_ = end + 1;
  return s;
}

std::string PgoutputReader::ReadBytes(std::size_t len) {
  Require(len);
  std::string s(data_.substr(offset_, len));
  offset_ += len;
  return s;
}

TupleData PgoutputReader::ReadTupleData() {
  const auto ncols = ReadInt16();
  if (ncols < 0) {
    throw util::DecodeError("pgoutput tuple has negative column count");
  }

  TupleData tuple;
  tuple.columns.reserve(static_cast<std::size_t>(ncols));

  for (int i = 0; i < ncols; ++i) {
    TupleColumn col;
    const auto  kind = static_cast<char>(ReadUInt8());

    switch (kind) {
      case 'n':
        col.kind = TupleDataKind::Null;
        break;
      case 'u':
        col.kind = TupleDataKind::Unchanged;
        break;
      case 't':
      case 'b': {
        col.kind       = kind == 't' ? TupleDataKind::Text : TupleDataKind::Binary;
        const auto len = ReadInt32();
        if (len < 0) {
          throw util::DecodeError("pgoutput column " + std::to_string(i) + " has negative length");
        }
        col.data = ReadBytes(static_cast<std::size_t>(len));
        break;
      }
      default:
        throw util::DecodeError(std::string("pgoutput column ") + std::to_string(i) + " has unknown kind '" + kind +
                                "'");
    }

    tuple.columns.push_back(std::move(col));
  }

  return tuple;
}

namespace {

RelationMessage ParseRelation(PgoutputReader& r) {
  RelationMessage m;
  m.relation_id      = r.ReadUInt32();
  m.namespace_name   = r.ReadString();
  m.relation_name    = r.ReadString();
  m.replica_identity = r.ReadUInt8();

  const auto ncols = r.ReadInt16();
  if (ncols < 0) {
    throw util::DecodeError("relation " + std::to_string(m.relation_id) + " has negative column count");
  }

  m.columns.reserve(static_cast<std::size_t>(ncols));
  for (int i = 0; i < ncols; ++i) {
    RelationColumn col;
    col.flags         = r.ReadUInt8();
    col.name          = r.ReadString();
    col.type_oid      = r.ReadUInt32();
    col.type_modifier = r.ReadInt32();
    m.columns.push_back(std::move(col));
  }
  return m;
}

InsertMessage ParseInsert(PgoutputReader& r) {
  InsertMessage m;
  m.relation_id = r.ReadUInt32();

  const auto marker = static_cast<char>(r.ReadUInt8());
  if (marker != 'N') {
    throw util::DecodeError(std::string("insert: expected new tuple marker 'N', got '") + marker + "'");
  }
  m.tuple = r.ReadTupleData();
  return m;
}

UpdateMessage ParseUpdate(PgoutputReader& r) {
  UpdateMessage m;
  m.relation_id = r.ReadUInt32();

  auto marker = static_cast<char>(r.ReadUInt8());
  if (marker == 'K' || marker == 'O') {
    m.old_tuple_type = marker;
    m.old_tuple      = r.ReadTupleData();
    marker           = static_cast<char>(r.ReadUInt8());
  }

  if (marker != 'N') {
    throw util::DecodeError(std::string("update: expected new tuple marker 'N', got '") + marker + "'");
  }
  m.new_tuple = r.ReadTupleData();
  return m;
}

DeleteMessage ParseDelete(PgoutputReader& r) {
  DeleteMessage m;
  m.relation_id = r.ReadUInt32();

  const auto marker = static_cast<char>(r.ReadUInt8());
  if (marker != 'K' && marker != 'O') {
    throw util::DecodeError(std::string("delete: expected old tuple marker 'K' or 'O', got '") + marker + "'");
  }
  m.old_tuple_type = marker;
  m.old_tuple      = r.ReadTupleData();
  return m;
}

} // namespace

Message ParseMessage(std::string_view data) {
  if (data.empty()) {
    throw util::DecodeError("empty pgoutput message");
  }

  PgoutputReader r(data.substr(1));

  switch (data[0]) {
    case 'R': return ParseRelation(r);
    case 'I': return ParseInsert(r);
    case 'U': return ParseUpdate(r);
    case 'D': return ParseDelete(r);
    default: return OtherMessage{data[0]};
  }
}

} // namespace pgcdc::wire

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "messages.hpp"

namespace pgcdc::wire {

/*
  Cursor over one pgoutput message body.

  pgoutput data is provided in network byte order (big endian). Every
  read past the end throws DecodeError.
*/
class PgoutputReader {
 public:
  explicit PgoutputReader(std::string_view data) : data_(data) {
  }

  std::uint8_t  ReadUInt8();
  std::int16_t  ReadInt16();
  std::int32_t  ReadInt32();
  std::uint32_t ReadUInt32();

  // NUL-terminated
  std::string ReadString();
  std::string ReadBytes(std::size_t len);

  TupleData ReadTupleData();

  bool AtEnd() const {
    return offset_ >= data_.size();
  }

  std::size_t Offset() const {
    return offset_;
  }

 private:
  void Require(std::size_t n) const;

  std::string_view data_;
  std::size_t      offset_ = 0;
};

// Parses one XLogData payload produced by pgoutput. Throws DecodeError.
Message ParseMessage(std::string_view data);

} // namespace pgcdc::wire

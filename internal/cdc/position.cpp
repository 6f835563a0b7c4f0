#include "position.hpp"

#include <google/protobuf/util/json_util.h>

#include "cdc/v1/position.pb.h"
#include "internal/util/errors.hpp"

namespace pgcdc::cdc {

std::string PositionCodec::Encode(util::Lsn last_lsn) {
  pgcdc::cdc::v1::Position position;
  position.set_type(pgcdc::cdc::v1::POSITION_TYPE_CDC);
  position.set_last_lsn(util::FormatLsn(last_lsn));

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(position, &json);
  if (!status.ok()) {
    throw util::FormatError("failed to serialize position: " + std::string(status.message()));
  }
  return json;
}

util::Lsn PositionCodec::Decode(std::string_view token) {
  pgcdc::cdc::v1::Position position;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(token), &position, options);
  if (!status.ok()) {
    throw util::FormatError("invalid position \"" + std::string(token) + "\": " + std::string(status.message()));
  }

  if (position.type() != pgcdc::cdc::v1::POSITION_TYPE_CDC) {
    throw util::FormatError("invalid position type " + pgcdc::cdc::v1::PositionType_Name(position.type()) +
                            ", expected " + pgcdc::cdc::v1::PositionType_Name(pgcdc::cdc::v1::POSITION_TYPE_CDC));
  }

  return util::ParseLsn(position.last_lsn());
}

int PositionCodec::Compare(std::string_view a, std::string_view b) {
  const auto lhs = Decode(a);
  const auto rhs = Decode(b);
  if (lhs < rhs) return -1;
  if (lhs > rhs) return 1;
  return 0;
}

} // namespace pgcdc::cdc

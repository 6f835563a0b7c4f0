#include "config_loader.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <charconv>
#include <system_error>

#include "internal/util/errors.hpp"

namespace pgcdc::config {

using google::protobuf::Descriptor;
using google::protobuf::FieldDescriptor;

namespace {

void NodeToValue(const YAML::Node& node, const FieldDescriptor* field, google::protobuf::Value* value);

const FieldDescriptor* FindField(const Descriptor* message, const std::string& key) {
  if (message == nullptr) return nullptr;
  if (const auto* field = message->FindFieldByName(key)) return field;
  for (int i = 0; i < message->field_count(); ++i) {
    if (message->field(i)->json_name() == key) return message->field(i);
  }
  return nullptr;
}

bool ParseNumber(const std::string& text, double* out) {
  const auto* end = text.data() + text.size();
  auto [ptr, ec]  = std::from_chars(text.data(), end, *out);
  return ec == std::errc() && ptr == end;
}

// A scalar takes the JSON type of the field it lands in, so a quoted or
// numeric-looking name stays a string. Unknown keys keep their text and
// are reported by the JSON parser.
void ScalarToValue(const YAML::Node& node, const FieldDescriptor* field, google::protobuf::Value* value) {
  const std::string& text = node.Scalar();
  if (field == nullptr) {
    value->set_string_value(text);
    return;
  }

  switch (field->cpp_type()) {
    case FieldDescriptor::CPPTYPE_BOOL:
      if (text == "true" || text == "false") {
        value->set_bool_value(text == "true");
        return;
      }
      break;

    case FieldDescriptor::CPPTYPE_INT32:
    case FieldDescriptor::CPPTYPE_INT64:
    case FieldDescriptor::CPPTYPE_UINT32:
    case FieldDescriptor::CPPTYPE_UINT64:
    case FieldDescriptor::CPPTYPE_FLOAT:
    case FieldDescriptor::CPPTYPE_DOUBLE: {
      double number = 0;
      if (ParseNumber(text, &number)) {
        value->set_number_value(number);
        return;
      }
      break;
    }

    default:
      break;
  }

  value->set_string_value(text);
}

// message: fields of a nested message; map_value: value field of a proto
// map. At most one is set.
void MapToStruct(const YAML::Node&        node,
                 const Descriptor*        message,
                 const FieldDescriptor*   map_value,
                 google::protobuf::Struct* out) {
  for (auto it : node) {
    const auto  key   = it.first.Scalar();
    const auto* child = map_value != nullptr ? map_value : FindField(message, key);
    NodeToValue(it.second, child, &(*out->mutable_fields())[key]);
  }
}

void NodeToValue(const YAML::Node& node, const FieldDescriptor* field, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      ScalarToValue(node, field, value);
      break;

    case YAML::NodeType::Sequence: {
      // elements of a repeated field share its descriptor
      auto* list_value = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
        NodeToValue(node[i], field, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      const Descriptor*      message   = nullptr;
      const FieldDescriptor* map_value = nullptr;
      if (field != nullptr && field->is_map()) {
        map_value = field->message_type()->FindFieldByName("value");
      } else if (field != nullptr && field->cpp_type() == FieldDescriptor::CPPTYPE_MESSAGE) {
        message = field->message_type();
      }
      MapToStruct(node, message, map_value, value->mutable_struct_value());
      break;
    }

    default:
      throw util::ConfigurationError("Unsupported YAML node");
  }
}

} // namespace

pgcdc::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::ConfigurationError("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromNode(yaml);
}

pgcdc::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml) {
  YAML::Node node;
  try {
    node = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw util::ConfigurationError("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromNode(node);
}

pgcdc::runtime::config::RuntimeConfig ConfigLoader::FromNode(const YAML::Node& yaml) {
  pgcdc::runtime::config::RuntimeConfig config;

  // empty document: all defaults
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw util::ConfigurationError("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Struct root;
  MapToStruct(yaml, pgcdc::runtime::config::RuntimeConfig::descriptor(), nullptr, &root);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(root, &json);
  if (!to_json_status.ok()) {
    throw util::ConfigurationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::ConfigurationError("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

} // namespace pgcdc::config

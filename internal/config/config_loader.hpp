#pragma once

#include <string>

#include "config/config.pb.h"

namespace YAML {
class Node;
}

namespace pgcdc::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Scalars are typed
  by the RuntimeConfig field they map to; unknown fields are rejected.
  All failures throw util::ConfigurationError.
*/
class ConfigLoader {
 public:
  static pgcdc::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static pgcdc::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

 private:
  static pgcdc::runtime::config::RuntimeConfig FromNode(const YAML::Node& node);
};

} // namespace pgcdc::config

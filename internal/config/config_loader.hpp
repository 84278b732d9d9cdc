#pragma once

#include <string>

#include "config/config.pb.h"

namespace YAML {
class Node;
}

namespace modstore::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  errors. Zero-valued fields mean "use the component default".
*/
class ConfigLoader {
 public:
  static modstore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static modstore::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& content);

 private:
  static modstore::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml);
};

} // namespace modstore::config

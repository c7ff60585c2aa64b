#pragma once

#include <string>

#include "config/config.pb.h"

namespace workgraph::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a protobuf Value, serialized to JSON and parsed into
  the RuntimeConfig message. Unknown keys are rejected.

  Throws std::runtime_error on unreadable files, malformed YAML and
  configurations that fail Validate().
*/
class ConfigLoader {
 public:
  static workgraph::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static workgraph::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills defaults and checks cross-field constraints.
  static void Validate(workgraph::runtime::config::RuntimeConfig& config);
};

} // namespace workgraph::config

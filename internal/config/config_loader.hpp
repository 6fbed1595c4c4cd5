#pragma once

#include <string>

#include "config/config.pb.h"

namespace trustmem::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a google.protobuf.Value, serialized to JSON and parsed
  into the config message. Unknown keys are rejected. Durations use the
  protobuf JSON form ("3600s"), enums their value names.
*/
class ConfigLoader {
 public:
  static trustmem::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static trustmem::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Semantic checks the JSON parser cannot express. Throws util::ValidationError
  // or util::PolicyConflict.
  static void Validate(const trustmem::runtime::config::RuntimeConfig& config);
};

} // namespace trustmem::config

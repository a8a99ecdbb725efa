#pragma once

#include <string>

#include "config/config.pb.h"

namespace snapmig::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Unset settings receive their defaults.
*/
class ConfigLoader {
 public:
  static snapmig::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills every unset (zero / empty) setting with its default.
  static void ApplyDefaults(snapmig::runtime::config::RuntimeConfig& config);

  // Rejects settings a run cannot work with. Throws std::runtime_error.
  static void Validate(const snapmig::runtime::config::RuntimeConfig& config);
};

} // namespace snapmig::config

#pragma once

#include <string>

#include "config/config.pb.h"

namespace relaystore::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected and a database backend is mandatory. Unset migration settings
  are filled with the backfill defaults.
*/
class ConfigLoader {
 public:
  static relaystore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static relaystore::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);
};

} // namespace relaystore::config

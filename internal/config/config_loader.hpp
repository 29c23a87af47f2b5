#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/transport/transport.hpp"

namespace rfshared::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static rfshared::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static rfshared::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

transport::ConnectOptions ToConnectOptions(const rfshared::runtime::config::ConnectionConfig& config);

} // namespace rfshared::config

#pragma once

#include <string>

#include "config/config.pb.h"

namespace auditgate::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Environment overrides are applied after parsing:

    AUDITGATE_AUDIT_DB_PATH  replaces audit.sqlite.path (selects sqlite)
    PORT                     replaces the port of server.bind_address
*/
class ConfigLoader {
 public:
  static auditgate::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyEnvironmentOverrides(auditgate::runtime::config::RuntimeConfig& config);
};

} // namespace auditgate::config

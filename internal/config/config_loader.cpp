#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace auditgate::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static std::string ReplacePort(const std::string& bind_address, const std::string& port) {
  if (bind_address.empty()) {
    return "0.0.0.0:" + port;
  }

  // [v6]:port keeps the bracketed host
  const auto colon = bind_address.rfind(':');
  if (colon == std::string::npos || (bind_address.front() == '[' && bind_address.rfind(']') > colon)) {
    return bind_address + ":" + port;
  }
  return bind_address.substr(0, colon + 1) + port;
}

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

auditgate::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  auditgate::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyEnvironmentOverrides(config);

  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("0.0.0.0:50061");
  }
  return config;
}

void ConfigLoader::ApplyEnvironmentOverrides(auditgate::runtime::config::RuntimeConfig& config) {
  // sqlite and memory share a oneof; the path only applies to the sqlite store.
  if (const char* db_path = std::getenv("AUDITGATE_AUDIT_DB_PATH"); db_path && *db_path && !config.audit().has_memory()) {
    config.mutable_audit()->mutable_sqlite()->set_path(db_path);
  }

  if (const char* port = std::getenv("PORT"); port && *port) {
    const std::string port_value(port);
    if (port_value.find_first_not_of("0123456789") != std::string::npos || port_value.size() > 5 || std::stoul(port_value) > 65535) {
      throw std::runtime_error("Invalid PORT environment value: " + port_value);
    }
    config.mutable_server()->set_bind_address(ReplacePort(config.server().bind_address(), port_value));
  }
}

} // namespace auditgate::config

#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace hostreg::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  // quoted scalars stay strings ("8080" for a string field must not become a number)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
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

hostreg::config::v1::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  // an empty file is a valid "all defaults" config
  if (yaml.IsNull()) {
    yaml = YAML::Node(YAML::NodeType::Map);
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  hostreg::config::v1::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(hostreg::config::v1::RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->bind_address().empty()) {
    server->set_bind_address(kDefaultBindAddress);
  }

  auto* discovery = config->mutable_discovery();
  if (discovery->systemctl_path().empty()) {
    discovery->set_systemctl_path(kDefaultSystemctl);
  }
  if (discovery->ss_path().empty()) {
    discovery->set_ss_path(kDefaultSs);
  }
  if (discovery->command_timeout_ms() == 0) {
    discovery->set_command_timeout_ms(kDefaultCommandTimeout);
  }

  auto* health = config->mutable_health();
  if (health->request_timeout_ms() == 0) {
    health->set_request_timeout_ms(kDefaultRequestTimeout);
  }
  if (health->cache_ttl_sec() == 0) {
    health->set_cache_ttl_sec(kDefaultHealthCacheTtl);
  }

  if (config->database().has_sqlite() && config->database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
}

} // namespace hostreg::config

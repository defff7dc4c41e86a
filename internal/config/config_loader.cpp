#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string>

namespace registry::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars carry the non-specific "!" tag and always stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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

registry::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  registry::runtime::config::RuntimeConfig config;

  auto* http = config.mutable_http();
  http->set_host("0.0.0.0");
  http->set_port(3001);
  http->set_threads(4);

  auto* grpc = config.mutable_grpc();
  grpc->set_enabled(false);
  grpc->set_bind_address("0.0.0.0:50051");

  auto* sqlite = config.mutable_database()->mutable_sqlite();
  sqlite->set_path((std::filesystem::path("data") / "registrations.db").string());
  sqlite->set_synchronous("NORMAL");
  sqlite->set_busy_timeout_ms(5000);

  config.mutable_logging()->set_level("info");
  return config;
}

registry::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  auto config = Defaults();
  if (yaml.IsNull()) {
    return config;
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

  registry::runtime::config::RuntimeConfig loaded;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &loaded, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  // sqlite settings merge over the defaults; choosing memory replaces the oneof
  config.MergeFrom(loaded);
  return config;
}

void ConfigLoader::ApplyEnvironment(registry::runtime::config::RuntimeConfig& config) {
  if (const char* port = std::getenv("PORT")) {
    char*      endptr = nullptr;
    const auto value  = std::strtoul(port, &endptr, 10);
    if (!endptr || *endptr != '\0' || *port == '\0' || value > std::numeric_limits<uint16_t>::max()) {
      throw std::runtime_error("Invalid PORT environment value: " + std::string(port));
    }
    config.mutable_http()->set_port(static_cast<uint32_t>(value));
  }

  if (const char* origin = std::getenv("ORIGIN")) {
    config.mutable_http()->set_origin(origin);
  }

  // an explicit path selects the sqlite backend with default tuning
  if (const char* db_path = std::getenv("REGISTRY_DB_PATH")) {
    if (!config.database().has_sqlite()) {
      *config.mutable_database() = Defaults().database();
    }
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
  }
}

void ConfigLoader::Validate(const registry::runtime::config::RuntimeConfig& config) {
  if (config.http().port() > std::numeric_limits<uint16_t>::max()) {
    throw std::runtime_error("Invalid configuration: http.port out of range: " + std::to_string(config.http().port()));
  }
  if (config.http().host().empty()) {
    throw std::runtime_error("Invalid configuration: http.host must not be empty");
  }
  if (config.grpc().enabled() && config.grpc().bind_address().empty()) {
    throw std::runtime_error("Invalid configuration: grpc.bind_address must be set when grpc is enabled");
  }
  if (config.database().has_sqlite()) {
    const auto& sqlite = config.database().sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("Invalid configuration: database.sqlite.path must not be empty");
    }
    if (sqlite.synchronous() != "NORMAL" && sqlite.synchronous() != "FULL") {
      throw std::runtime_error("Invalid configuration: database.sqlite.synchronous must be NORMAL or FULL");
    }
  } else if (!config.database().has_memory()) {
    throw std::runtime_error("Invalid configuration: database must configure sqlite or memory");
  }
}

} // namespace registry::config

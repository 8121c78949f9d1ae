#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

namespace graphvc::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings ("123", "true")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
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

static graphvc::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  graphvc::runtime::config::RuntimeConfig config;

  // an empty document is a valid, all-defaults config
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

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

static void Require(bool ok, const std::string& what) {
  if (!ok) {
    throw std::runtime_error("Invalid configuration: " + what);
  }
}

// checks values the proto schema cannot express
static void Validate(const graphvc::runtime::config::RuntimeConfig& config) {
  static constexpr std::array<std::string_view, 8> kLevels = {"", "trace", "debug", "info", "warn", "error", "critical", "off"};

  const auto& level = config.logging().level();
  Require(std::find(kLevels.begin(), kLevels.end(), level) != kLevels.end(), "unknown logging.level '" + level + "'");

  const auto& database = config.database();
  if (database.has_sqlite()) {
    Require(!database.sqlite().path().empty(), "database.sqlite.path is required");
  }
  if (database.has_postgres()) {
    Require(!database.postgres().connection_uri().empty(), "database.postgres.connection_uri is required");
  }

  Require(config.diff().float_tolerance() >= 0.0, "diff.float_tolerance must not be negative");

  for (int i = 0; i < config.validation().types_size(); ++i) {
    const auto& rule = config.validation().types(i);
    Require(!rule.type().empty(), "validation.types[" + std::to_string(i) + "].type is required");
    for (const auto& property : rule.required_properties()) {
      Require(!property.empty(), "validation.types[" + std::to_string(i) + "] has an empty required property");
    }
  }

  const auto& tracing  = config.tracing();
  const auto& exporter = tracing.exporter();
  Require(exporter.empty() || exporter == "otlp" || exporter == "stdout", "unknown tracing.exporter '" + exporter + "'");
  Require(tracing.sample_ratio() >= 0.0 && tracing.sample_ratio() <= 1.0, "tracing.sample_ratio must be within [0, 1]");
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

graphvc::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  auto config = FromYamlNode(yaml);
  Validate(config);
  return config;
}

graphvc::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  auto config = FromYamlNode(yaml);
  Validate(config);
  return config;
}

graphvc::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  graphvc::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("info");
  config.mutable_database()->mutable_memory();
  config.mutable_diff()->set_string_truncate_threshold(256);
  config.mutable_diff()->set_object_truncate_threshold(2048);
  config.mutable_diff()->set_max_change_summary_bytes(16384);
  return config;
}

} // namespace graphvc::config

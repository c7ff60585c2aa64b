#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace workgraph::config {

using workgraph::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultBindAddress = "0.0.0.0:50061";
constexpr uint32_t    kMaxShardCount      = 1024;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // quoted scalars stay strings ("8080" is not a number)
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  char*        endptr  = nullptr;
  const double numeric = std::strtod(scalar.c_str(), &endptr);
  if (!scalar.empty() && endptr && *endptr == '\0' && std::isfinite(numeric)) {
    value->set_number_value(numeric);
    return;
  }

  value->set_string_value(scalar);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (const auto& child : node) {
        YamlToProtoValue(child, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (const auto& it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }
  }
}

RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  // an empty document is a valid, all-defaults configuration
  if (json_value.kind_case() == google::protobuf::Value::kNullValue) {
    json_value.mutable_struct_value();
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

void RequireNonNegative(double value, const char* field) {
  if (value < 0 || !std::isfinite(value)) {
    throw std::runtime_error(std::string("Invalid configuration: ") + field + " must be a non-negative number");
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

void ConfigLoader::Validate(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* database = config.mutable_database();
  if (database->has_sqlite()) {
    if (database->sqlite().path().empty()) {
      throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
    }
  } else if (!database->has_memory()) {
    database->mutable_memory();
  }

  if (config.index().shard_count() > kMaxShardCount) {
    throw std::runtime_error("Invalid configuration: index.shard_count exceeds " + std::to_string(kMaxShardCount));
  }

  const auto& weights = config.analytics().weights();
  RequireNonNegative(weights.priority().low(), "analytics.weights.priority.low");
  RequireNonNegative(weights.priority().medium(), "analytics.weights.priority.medium");
  RequireNonNegative(weights.priority().high(), "analytics.weights.priority.high");
  RequireNonNegative(weights.priority().critical(), "analytics.weights.priority.critical");
  RequireNonNegative(weights.transitive_factor(), "analytics.weights.transitive_factor");
  RequireNonNegative(weights.priority_score_multiplier(), "analytics.weights.priority_score_multiplier");
  RequireNonNegative(weights.unlock_score_multiplier(), "analytics.weights.unlock_score_multiplier");
  RequireNonNegative(weights.effort_divisor_hours(), "analytics.weights.effort_divisor_hours");
  RequireNonNegative(weights.effort_penalty_cap(), "analytics.weights.effort_penalty_cap");
  RequireNonNegative(weights.quick_win_max_hours(), "analytics.weights.quick_win_max_hours");
}

} // namespace workgraph::config

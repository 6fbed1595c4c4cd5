#include "internal/config/config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <set>
#include <stdexcept>

#include "internal/gc/garbage_collector.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace trustmem::config {

using trustmem::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // Quoted scalars stay strings.
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

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;
  // An empty document yields the defaults.
  if (yaml.IsNull()) return config;

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

  ConfigLoader::Validate(config);
  return config;
}

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
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void ConfigLoader::Validate(const RuntimeConfig& config) {
  auto in_unit = [](double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; };

  const auto& scoring = config.scoring();
  for (const auto& entry : scoring.reputation()) {
    if (entry.component().empty()) {
      throw util::ValidationError("scoring.reputation: component is required");
    }
    if (!in_unit(entry.reputation())) {
      throw util::ValidationError("scoring.reputation[" + entry.component() + "]: reputation must be in [0,1]");
    }
  }
  if (scoring.has_default_reputation() && !in_unit(scoring.default_reputation())) {
    throw util::ValidationError("scoring.default_reputation must be in [0,1]");
  }
  if (scoring.has_violation_penalty() && !in_unit(scoring.violation_penalty())) {
    throw util::ValidationError("scoring.violation_penalty must be in [0,1]");
  }
  if (scoring.has_consistency_rate() && !in_unit(scoring.consistency_rate())) {
    throw util::ValidationError("scoring.consistency_rate must be in [0,1]");
  }

  std::set<int> seen_categories;
  for (const auto& category : config.categories()) {
    if (category.category() == trustmem::v1::OUTPUT_CATEGORY_UNSPECIFIED) {
      throw util::ValidationError("categories: category is required");
    }
    if (!seen_categories.insert(category.category()).second) {
      throw util::ValidationError("categories: duplicate entry for " + trustmem::v1::OutputCategory_Name(category.category()));
    }
    const bool has_curve     = category.decay_curve() != trustmem::v1::DECAY_CURVE_UNSPECIFIED;
    const bool has_half_life = category.has_half_life();
    if (has_curve != has_half_life) {
      throw util::ValidationError("categories[" + trustmem::v1::OutputCategory_Name(category.category()) +
                                  "]: decay_curve and half_life must be set together");
    }
    if (has_half_life && (category.half_life().seconds() < 0 || (category.half_life().seconds() == 0 && category.half_life().nanos() <= 0))) {
      throw util::ValidationError("categories[" + trustmem::v1::OutputCategory_Name(category.category()) + "]: half_life must be positive");
    }
  }

  if (config.database().has_sqlite() && util::FromProtoDuration(config.database().sqlite().busy_timeout()).count() < 0) {
    throw util::ValidationError("database.sqlite.busy_timeout must not be negative");
  }

  const auto& bank = config.bank();
  if (bank.has_default_relevance() && !in_unit(bank.default_relevance())) {
    throw util::ValidationError("bank.default_relevance must be in [0,1]");
  }

  std::set<std::string> seen_policies;
  for (const auto& policy : config.gc().policies()) {
    gc::GarbageCollector::ValidatePolicy(policy);
    if (!seen_policies.insert(policy.name()).second) {
      throw util::ValidationError("gc.policies: duplicate policy " + policy.name());
    }
  }
}

} // namespace trustmem::config

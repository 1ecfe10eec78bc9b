#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace epicflow::config {

namespace {

void ToValue(const YAML::Node& node, google::protobuf::Value* value);

void ScalarToValue(const YAML::Node& node, google::protobuf::Value* value) {
  const auto& text = node.Scalar();

  // Quoted scalars carry the non-specific "!" tag and always stay strings.
  if (node.Tag() == "!") {
    value->set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    value->set_bool_value(text == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (!text.empty() && end && *end == '\0') {
    value->set_number_value(number);
    return;
  }

  value->set_string_value(text);
}

void ToValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      ScalarToValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        ToValue(item, list->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        ToValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node at line " + std::to_string(node.Mark().line + 1));
  }
}

epicflow::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  epicflow::runtime::config::RuntimeConfig config;

  // Empty document: every section takes its defaults.
  if (!yaml || yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value root;
  ToValue(yaml, &root);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(root, &json);
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

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

epicflow::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config '" + path + "': " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

epicflow::runtime::config::RuntimeConfig ConfigLoader::ParseYaml(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

} // namespace epicflow::config

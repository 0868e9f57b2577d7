#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cstdlib>
#include <stdexcept>

namespace mediaflow::config {

namespace {

using google::protobuf::Value;

std::string Where(const YAML::Node& node, const std::string& key_path) {
  const auto mark = node.Mark();
  std::string where = key_path.empty() ? "<root>" : key_path;
  if (!mark.is_null()) {
    where += " (line " + std::to_string(mark.line + 1) + ")";
  }
  return where;
}

// Quoted scalars stay strings; "2" and "true" in quotes are never coerced.
void SetScalar(const YAML::Node& node, Value* value) {
  const std::string& scalar = node.Scalar();
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }
  if (scalar == "null" || scalar == "~") {
    value->set_null_value(google::protobuf::NULL_VALUE);
    return;
  }

  if (!scalar.empty()) {
    errno        = 0;
    char*  end   = nullptr;
    double parsed = std::strtod(scalar.c_str(), &end);
    if (end != nullptr && *end == '\0' && errno != ERANGE) {
      value->set_number_value(parsed);
      return;
    }
  }

  value->set_string_value(scalar);
}

void ToValue(const YAML::Node& node, const std::string& key_path, Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      SetScalar(node, value);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
        ToValue(node[i], key_path + "[" + std::to_string(i) + "]", list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        if (!entry.first.IsScalar()) {
          throw std::runtime_error("Invalid configuration: non-scalar key at " + Where(entry.first, key_path));
        }
        const auto& key = entry.first.Scalar();
        ToValue(entry.second, key_path.empty() ? key : key_path + "." + key, &(*fields)[key]);
      }
      return;
    }

    case YAML::NodeType::Undefined:
      break;
  }
  throw std::runtime_error("Invalid configuration: unsupported YAML node at " + Where(node, key_path));
}

mediaflow::runtime::config::RuntimeConfig Parse(const YAML::Node& yaml) {
  mediaflow::runtime::config::RuntimeConfig config;

  // An empty document is a valid, all-defaults configuration.
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  Value root;
  ToValue(yaml, "", &root);

  std::string json;
  if (auto status = google::protobuf::util::MessageToJsonString(root, &json); !status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  if (auto status = google::protobuf::util::JsonStringToMessage(json, &config, options); !status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

} // namespace

mediaflow::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }
  return Parse(yaml);
}

mediaflow::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML config: ") + e.what());
  }
  return Parse(yaml);
}

} // namespace mediaflow::config

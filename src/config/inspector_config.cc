#define DUMPSCOPE_LOG_COMPONENT "config.file"

#include "dumpscope/config/inspector_config.h"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>

#include "dumpscope/logging/log_level.h"
#include "dumpscope/logging/log_macros.h"

namespace dumpscope {
namespace config {

namespace {

json::JsonValue yamlToJsonValue(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return json::JsonValue::null();
    case YAML::NodeType::Scalar: {
      const std::string& text = node.Scalar();
      // Quoted scalars stay strings
      if (node.Tag() == "!") {
        return json::JsonValue(text);
      }
      if (text == "true" || text == "false") {
        return json::JsonValue(text == "true");
      }
      int64_t integer = 0;
      if (YAML::convert<int64_t>::decode(node, integer)) {
        return json::JsonValue(integer);
      }
      double number = 0;
      if (text.find('.') != std::string::npos &&
          YAML::convert<double>::decode(node, number)) {
        return json::JsonValue(number);
      }
      return json::JsonValue(text);
    }
    case YAML::NodeType::Sequence: {
      auto result = json::JsonValue::array();
      for (const auto& item : node) {
        result.push_back(yamlToJsonValue(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      auto result = json::JsonValue::object();
      for (const auto& pair : node) {
        result.set(pair.first.Scalar(), yamlToJsonValue(pair.second));
      }
      return result;
    }
    default:
      break;
  }

  return json::JsonValue::null();
}

json::JsonValue parseYaml(const std::string& content) {
  try {
    return yamlToJsonValue(YAML::Load(content));
  } catch (const YAML::ParserException& e) {
    std::ostringstream error;
    error << "YAML parse error at line " << e.mark.line + 1 << ", column "
          << e.mark.column + 1;
    throw ConfigValidationError("config_file", error.str());
  }
}

json::JsonValue parseJson(const std::string& content) {
  try {
    return json::JsonValue::parse(content);
  } catch (const json::JsonException& e) {
    throw ConfigValidationError("config_file",
                                std::string("JSON parse error: ") + e.what());
  }
}

bool endsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string readString(const json::JsonValue& j,
                       const std::string& key,
                       const std::string& field) {
  const auto& value = j[key];
  if (!value.isString()) {
    throw ConfigValidationError(field, "must be a string");
  }
  return value.getString();
}

}  // namespace

void InspectorConfig::validate() const {
  logging::LogLevel level = logging::LogLevel::Info;
  if (!logging::parseLogLevel(log_level, level)) {
    throw ConfigValidationError("log_level",
                                "Unknown log level: " + log_level);
  }

  if (log_format != "text" && log_format != "json") {
    throw ConfigValidationError(
        "log_format", "must be 'text' or 'json', got '" + log_format + "'");
  }

  if (output != "short" && output != "json") {
    throw ConfigValidationError(
        "output", "must be 'short' or 'json', got '" + output + "'");
  }

  if (port > kMaxPort) {
    throw ConfigValidationError("filter.port",
                                "Port out of range: " + std::to_string(port));
  }
}

json::JsonValue InspectorConfig::toJson() const {
  json::JsonObjectBuilder filter_builder;
  filter_builder.add("address", address)
      .add("port", static_cast<int64_t>(port))
      .add("type", type);

  json::JsonObjectBuilder builder;
  builder.add("log_level", log_level)
      .add("log_format", log_format)
      .add("output", output)
      .add("filter", filter_builder.build());
  return builder.build();
}

InspectorConfig InspectorConfig::fromJson(const json::JsonValue& j) {
  InspectorConfig config;

  if (j.isNull()) {
    return config;
  }
  if (!j.isObject()) {
    throw ConfigValidationError("config", "must be an object");
  }

  if (j.contains("log_level")) {
    config.log_level = readString(j, "log_level", "log_level");
  }
  if (j.contains("log_format")) {
    config.log_format = readString(j, "log_format", "log_format");
  }
  if (j.contains("output")) {
    config.output = readString(j, "output", "output");
  }

  if (j.contains("filter") && !j["filter"].isNull()) {
    const auto& filter = j["filter"];
    if (!filter.isObject()) {
      throw ConfigValidationError("filter", "must be an object");
    }
    if (filter.contains("address")) {
      config.address = readString(filter, "address", "filter.address");
    }
    if (filter.contains("port")) {
      const auto& port = filter["port"];
      if (!port.isInteger() || port.getInt64() < 0 ||
          port.getInt64() > static_cast<int64_t>(UINT32_MAX)) {
        throw ConfigValidationError("filter.port",
                                    "must be a non-negative integer");
      }
      config.port = static_cast<uint32_t>(port.getInt64());
    }
    if (filter.contains("type")) {
      config.type = readString(filter, "type", "filter.type");
    }
  }

  return config;
}

InspectorConfig InspectorConfig::fromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigValidationError("config_file",
                                "Cannot open config file: " + path);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());

  json::JsonValue root =
      endsWith(path, ".json") ? parseJson(content) : parseYaml(content);

  InspectorConfig config = fromJson(root);
  config.validate();

  DUMPSCOPE_LOG(Debug, "loaded configuration from {}", path);
  return config;
}

std::string resolveConfigPath(const std::string& flag_path) {
  if (!flag_path.empty()) {
    return flag_path;
  }
  const char* env_path = std::getenv(kConfigPathEnv);
  if (env_path != nullptr && env_path[0] != '\0') {
    return env_path;
  }
  return std::string();
}

}  // namespace config
}  // namespace dumpscope

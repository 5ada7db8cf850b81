/**
 * @file inspector_config.h
 * @brief Inspector settings loaded from a JSON or YAML file
 *
 * Example (YAML):
 *
 *   log_level: debug
 *   log_format: json
 *   output: short
 *   filter:
 *     address: 10.0.0.1
 *     port: 8080
 *     type: HTTP
 */

#pragma once

#include <cstdint>
#include <string>

#include "dumpscope/config/config_error.h"
#include "dumpscope/configdump/listener_filter.h"
#include "dumpscope/json/json_bridge.h"

namespace dumpscope {
namespace config {

/// Environment variable naming a configuration file
constexpr char kConfigPathEnv[] = "DUMPSCOPE_CONFIG";

/// Highest port a filter may name
constexpr uint32_t kMaxPort = 65535;

struct InspectorConfig {
  /// Minimum log level ("debug" .. "emergency", "off")
  std::string log_level = "warning";

  /// Log line format: "text" or "json"
  std::string log_format = "text";

  /// Listener view: "short" (summary table) or "json" (full dump)
  std::string output = "short";

  /// Default listener filter; empty values and port 0 match everything
  std::string address;
  uint32_t port = 0;
  std::string type;

  /**
   * @brief Validate value ranges and enumerations
   * @throws ConfigValidationError naming the first bad field
   */
  void validate() const;

  configdump::ListenerFilter filter() const {
    configdump::ListenerFilter f;
    f.address = address;
    f.port = port;
    f.type = type;
    return f;
  }

  json::JsonValue toJson() const;

  /**
   * @brief Create from JSON
   *
   * Missing keys keep their defaults; unknown keys are ignored.
   * @throws ConfigValidationError on a value of the wrong type
   */
  static InspectorConfig fromJson(const json::JsonValue& j);

  /**
   * @brief Load, convert and validate a configuration file
   *
   * Files ending in ".json" are parsed as JSON, anything else as YAML.
   * @throws ConfigValidationError when the file cannot be read or parsed
   */
  static InspectorConfig fromFile(const std::string& path);

  bool operator==(const InspectorConfig& other) const {
    return log_level == other.log_level && log_format == other.log_format &&
           output == other.output && address == other.address &&
           port == other.port && type == other.type;
  }

  bool operator!=(const InspectorConfig& other) const {
    return !(*this == other);
  }
};

/**
 * @brief Choose the configuration file to load
 *
 * @param flag_path Path given on the command line, or empty
 * @return flag_path if set, else $DUMPSCOPE_CONFIG, else empty (defaults)
 */
std::string resolveConfigPath(const std::string& flag_path);

}  // namespace config
}  // namespace dumpscope

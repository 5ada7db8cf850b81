#pragma once

#include <cstdint>
#include <string>

namespace dumpscope {
namespace logging {

// Log levels (RFC-5424 severities)
enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Notice = 2,
  Warning = 3,
  Error = 4,
  Critical = 5,
  Alert = 6,
  Emergency = 7,
  Off = 8
};

// Component identifiers for hierarchical logging
enum class Component {
  Root,
  ConfigDump,
  Listener,
  Render,
  Config,
  Cli,
  Count
};

// Sink types
enum class SinkType { Stdio, Null };

inline const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Notice: return "NOTICE";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Critical: return "CRITICAL";
    case LogLevel::Alert: return "ALERT";
    case LogLevel::Emergency: return "EMERGENCY";
    case LogLevel::Off: return "OFF";
    default: return "UNKNOWN";
  }
}

// Returns false when str names no level; level is left untouched then.
inline bool parseLogLevel(const std::string& str, LogLevel& level) {
  if (str == "DEBUG" || str == "debug") level = LogLevel::Debug;
  else if (str == "INFO" || str == "info") level = LogLevel::Info;
  else if (str == "NOTICE" || str == "notice") level = LogLevel::Notice;
  else if (str == "WARNING" || str == "warning") level = LogLevel::Warning;
  else if (str == "ERROR" || str == "error") level = LogLevel::Error;
  else if (str == "CRITICAL" || str == "critical") level = LogLevel::Critical;
  else if (str == "ALERT" || str == "alert") level = LogLevel::Alert;
  else if (str == "EMERGENCY" || str == "emergency") level = LogLevel::Emergency;
  else if (str == "OFF" || str == "off") level = LogLevel::Off;
  else return false;
  return true;
}

inline LogLevel stringToLogLevel(const std::string& str) {
  LogLevel level = LogLevel::Info;  // Default
  parseLogLevel(str, level);
  return level;
}

inline const char* componentToString(Component component) {
  switch (component) {
    case Component::Root: return "Root";
    case Component::ConfigDump: return "ConfigDump";
    case Component::Listener: return "Listener";
    case Component::Render: return "Render";
    case Component::Config: return "Config";
    case Component::Cli: return "Cli";
    default: return "Unknown";
  }
}

}  // namespace logging
}  // namespace dumpscope

#pragma once

#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "dumpscope/logging/logger.h"

namespace dumpscope {
namespace logging {

// Pattern for glob-style log level control
struct LogPattern {
  std::regex pattern;
  LogLevel level;

  LogPattern(const std::string& glob, LogLevel lvl)
      : pattern(globToRegex(glob)), level(lvl) {}

 private:
  static std::string globToRegex(const std::string& glob) {
    std::string regex;
    for (char c : glob) {
      switch (c) {
        case '*':
          regex += ".*";
          break;
        case '?':
          regex += ".";
          break;
        case '.':
          regex += "\\.";
          break;
        default:
          regex += c;
          break;
      }
    }
    return regex;
  }
};

class LoggerRegistry {
 public:
  // Process-wide instance with stderr output at Info level
  static LoggerRegistry& instance();

  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);

  // Applies to every logger not governed by a pattern
  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  // Pattern-based log level control ("config_dump.*")
  void setPattern(const std::string& pattern, LogLevel level);

  // Replaces the sink of every registered logger and of future ones
  void setSink(std::shared_ptr<LogSink> sink);

  bool shouldLog(const std::string& logger_name, LogLevel level);

  LogLevel getEffectiveLevel(const std::string& name);

  static std::string getComponentPath(Component comp, const std::string& name);

  // Drops patterns, named loggers and custom sinks (tests)
  void reset();

 private:
  LoggerRegistry();

  void initializeDefaults();

  LogLevel getEffectiveLevelLocked(const std::string& name) const;

  // Re-derives every registered logger's level from patterns and global level
  void applyLevelsLocked();

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::vector<LogPattern> patterns_;

  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<LogSink> default_sink_;
};

// Component logger with automatic hierarchy
class ComponentLogger {
 public:
  ComponentLogger(Component component, const std::string& name)
      : component_(component) {
    logger_ = LoggerRegistry::instance().getOrCreateLogger(
        LoggerRegistry::getComponentPath(component, name));
  }

  template <typename... Args>
  void log(LogLevel level, const char* fmt, Args&&... args) {
    if (logger_->shouldLog(level)) {
      logger_->logWithComponent(level, component_, fmt,
                                std::forward<Args>(args)...);
    }
  }

 private:
  Component component_;
  std::shared_ptr<Logger> logger_;
};

}  // namespace logging
}  // namespace dumpscope

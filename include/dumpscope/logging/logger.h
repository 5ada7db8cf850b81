#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "dumpscope/logging/log_level.h"
#include "dumpscope/logging/log_message.h"
#include "dumpscope/logging/log_sink.h"

namespace dumpscope {
namespace logging {

// Named logger writing synchronously to one sink. Format strings use {fmt}
// replacement fields and are checked at runtime.
class Logger {
 public:
  explicit Logger(std::string name) : name_(std::move(name)) {}

  template <typename... Args>
  void debug(const char* fmt, Args&&... args) {
    write(LogLevel::Debug, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const char* fmt, Args&&... args) {
    write(LogLevel::Info, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warning(const char* fmt, Args&&... args) {
    write(LogLevel::Warning, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const char* fmt, Args&&... args) {
    write(LogLevel::Error, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void write(LogLevel level, const char* fmt, Args&&... args) {
    if (!shouldLog(level)) {
      return;
    }
    LogMessage msg;
    emit(msg, level, fmt, std::forward<Args>(args)...);
  }

  // Used by COMPONENT_LOG
  template <typename... Args>
  void logWithComponent(LogLevel level,
                        Component component,
                        const char* fmt,
                        Args&&... args) {
    if (!shouldLog(level)) {
      return;
    }
    LogMessage msg;
    msg.component = component;
    emit(msg, level, fmt, std::forward<Args>(args)...);
  }

  // Used by DUMPSCOPE_LOG
  template <typename... Args>
  void log(LogLevel level,
           const char* file,
           int line,
           const char* function,
           const char* fmt,
           Args&&... args) {
    if (!shouldLog(level)) {
      return;
    }
    LogMessage msg;
    msg.file = file;
    msg.line = line;
    msg.function = function;
    emit(msg, level, fmt, std::forward<Args>(args)...);
  }

  void setLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
  }

  LogLevel getLevel() const { return level_.load(std::memory_order_relaxed); }

  bool shouldLog(LogLevel level) const {
    const LogLevel current = getLevel();
    return current != LogLevel::Off && level >= current;
  }

  void setSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
  }

  const std::string& getName() const { return name_; }

 private:
  template <typename... Args>
  void emit(LogMessage& msg,
            LogLevel level,
            const char* fmt,
            Args&&... args) {
    msg.level = level;
    msg.logger_name = name_;
    msg.message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);

    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
      sink_->log(msg);
    }
  }

  const std::string name_;
  std::atomic<LogLevel> level_{LogLevel::Info};
  std::shared_ptr<LogSink> sink_;
  std::mutex sink_mutex_;
};

}  // namespace logging
}  // namespace dumpscope

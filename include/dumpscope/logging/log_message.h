#pragma once

#include <unistd.h>

#include <chrono>
#include <string>

#include "dumpscope/logging/log_level.h"

namespace dumpscope {
namespace logging {

// One log record as handed to a sink
struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string logger_name;
  std::string message;
  std::chrono::system_clock::time_point timestamp{
      std::chrono::system_clock::now()};
  pid_t process_id{getpid()};

  Component component{Component::Root};
  std::string component_name;

  // Set by DUMPSCOPE_LOG; null for component logs
  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};
};

}  // namespace logging
}  // namespace dumpscope

#pragma once

#include <string>

#include "dumpscope/logging/log_message.h"

namespace dumpscope {
namespace logging {

// Turns a record into one output line, without the trailing newline
class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

// "[time] [LEVEL] [Component.name] [logger] [file:line fn()] message"
class DefaultFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// One JSON object per line (log_format: json)
class JsonFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

}  // namespace logging
}  // namespace dumpscope

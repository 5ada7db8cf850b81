#include "dumpscope/logging/log_formatter.h"

#include <ctime>
#include <iterator>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "dumpscope/json/json_bridge.h"

namespace dumpscope {
namespace logging {

namespace {

std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          tp.time_since_epoch())
                          .count() %
                      1000;

  std::tm local{};
  localtime_r(&seconds, &local);
  return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03d}", local, millis);
}

}  // namespace

std::string DefaultFormatter::format(const LogMessage& msg) const {
  fmt::memory_buffer out;
  auto it = std::back_inserter(out);

  fmt::format_to(it, "[{}] [{}] ", formatTimestamp(msg.timestamp),
                 logLevelToString(msg.level));

  if (msg.component != Component::Root) {
    if (msg.component_name.empty()) {
      fmt::format_to(it, "[{}] ", componentToString(msg.component));
    } else {
      fmt::format_to(it, "[{}.{}] ", componentToString(msg.component),
                     msg.component_name);
    }
  }

  fmt::format_to(it, "[{}] ", msg.logger_name);

  if (msg.file && msg.line > 0) {
    if (msg.function) {
      fmt::format_to(it, "[{}:{} {}()] ", msg.file, msg.line, msg.function);
    } else {
      fmt::format_to(it, "[{}:{}] ", msg.file, msg.line);
    }
  }

  fmt::format_to(it, "{}", msg.message);

  return fmt::to_string(out);
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  json::JsonObjectBuilder record;
  record.add("timestamp", formatTimestamp(msg.timestamp))
      .add("level", logLevelToString(msg.level))
      .add("logger", msg.logger_name)
      .add("pid", static_cast<int64_t>(msg.process_id));

  if (msg.component != Component::Root) {
    record.add("component", componentToString(msg.component));
    if (!msg.component_name.empty()) {
      record.add("component_name", msg.component_name);
    }
  }

  if (msg.file) {
    record.add("file", msg.file).add("line", msg.line);
    if (msg.function) {
      record.add("function", msg.function);
    }
  }

  record.add("message", msg.message);

  // Listener payloads may carry invalid UTF-8; replace rather than throw
  return record.build().dump(-1, false);
}

}  // namespace logging
}  // namespace dumpscope

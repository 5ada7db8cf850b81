#include "dumpscope/logging/log_sink.h"

namespace dumpscope {
namespace logging {

void StdioSink::log(const LogMessage& msg) {
  std::lock_guard<std::mutex> lock(mutex_);
  stream() << formatter_->format(msg) << '\n';
}

void StdioSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  stream().flush();
}

std::unique_ptr<LogSink> SinkFactory::createStdioSink(bool use_stderr) {
  return std::make_unique<StdioSink>(use_stderr ? StdioSink::Stderr
                                                : StdioSink::Stdout);
}

std::unique_ptr<LogSink> SinkFactory::createNullSink() {
  return std::make_unique<NullSink>();
}

}  // namespace logging
}  // namespace dumpscope

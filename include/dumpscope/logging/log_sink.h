#pragma once

#include <iostream>
#include <memory>
#include <mutex>

#include "dumpscope/logging/log_formatter.h"
#include "dumpscope/logging/log_message.h"

namespace dumpscope {
namespace logging {

// Base sink interface
class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual void log(const LogMessage& msg) = 0;
  virtual void flush() = 0;
  virtual SinkType type() const = 0;

  virtual void setFormatter(std::unique_ptr<Formatter> formatter) {
    formatter_ = std::move(formatter);
  }

 protected:
  std::unique_ptr<Formatter> formatter_{std::make_unique<DefaultFormatter>()};
};

// Stdio sink (stdout/stderr). Diagnostics default to stderr so they never
// interleave with inspection output on stdout.
class StdioSink : public LogSink {
 public:
  enum Target { Stdout, Stderr };

  explicit StdioSink(Target target = Stderr) : target_(target) {}

  void log(const LogMessage& msg) override;
  void flush() override;
  SinkType type() const override { return SinkType::Stdio; }

 private:
  std::ostream& stream() const {
    return (target_ == Stdout) ? std::cout : std::cerr;
  }

  Target target_;
  std::mutex mutex_;
};

// High-performance null sink
class NullSink : public LogSink {
 public:
  void log(const LogMessage&) override {}
  void flush() override {}
  SinkType type() const override { return SinkType::Null; }
};

class SinkFactory {
 public:
  static std::unique_ptr<LogSink> createStdioSink(bool use_stderr = true);
  static std::unique_ptr<LogSink> createNullSink();
};

}  // namespace logging
}  // namespace dumpscope

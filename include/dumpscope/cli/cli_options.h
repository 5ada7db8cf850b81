#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>

#include "dumpscope/config/inspector_config.h"

namespace dumpscope {
namespace cli {

/// Exit codes of the dumpscope executable
constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

/// Reads the config dump from standard input
constexpr char kStdinPath[] = "-";

/**
 * @brief Malformed command line
 */
class UsageError : public std::runtime_error {
 public:
  explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Parsed command line
 *
 * Unset optionals fall back to the configuration file, then to defaults.
 */
struct CliOptions {
  bool help = false;
  std::string config_path;
  std::string dump_path = kStdinPath;

  std::optional<std::string> address;
  std::optional<uint32_t> port;
  std::optional<std::string> type;
  std::optional<std::string> output;
  std::optional<std::string> log_level;
};

/**
 * @brief Parse argv
 * @throws UsageError on an unknown flag, a missing value or a bad port
 */
CliOptions parseArguments(int argc, const char* const argv[]);

void printUsage(const char* program, std::ostream& out);

/**
 * @brief Resolve the effective configuration
 *
 * Loads the file named by --config or $DUMPSCOPE_CONFIG, if any, then
 * applies command-line overrides and validates the result.
 * @throws config::ConfigValidationError
 */
config::InspectorConfig loadConfig(const CliOptions& options);

/**
 * @brief Point the logging registry at stderr with the configured level and
 * line format
 */
void configureLogging(const config::InspectorConfig& config);

/**
 * @brief Inspect one config dump
 *
 * Listener output goes to @p out; "Error: <message>" lines go to @p err.
 * @return kExitSuccess or kExitFailure
 */
int runInspector(const CliOptions& options,
                 std::istream& in,
                 std::ostream& out,
                 std::ostream& err);

}  // namespace cli
}  // namespace dumpscope

#define DUMPSCOPE_LOG_COMPONENT "cli"

#include "dumpscope/cli/cli_options.h"

#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>

#include "dumpscope/configdump/config_writer.h"
#include "dumpscope/logging/log_macros.h"

namespace dumpscope {
namespace cli {

namespace {

uint32_t parsePort(const std::string& text) {
  if (text.empty() || text.size() > 5) {
    throw UsageError("invalid port: '" + text + "'");
  }
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw UsageError("invalid port: '" + text + "'");
    }
  }
  const unsigned long value = std::stoul(text);
  if (value > config::kMaxPort) {
    throw UsageError("invalid port: '" + text + "'");
  }
  return static_cast<uint32_t>(value);
}

bool readDump(const CliOptions& options,
              std::istream& in,
              std::string& dump,
              std::string& error) {
  if (options.dump_path.empty() || options.dump_path == kStdinPath) {
    dump.assign(std::istreambuf_iterator<char>(in),
                std::istreambuf_iterator<char>());
    if (in.bad()) {
      error = "failed to read config dump from stdin";
      return false;
    }
    return true;
  }

  std::ifstream file(options.dump_path, std::ios::binary);
  if (!file.is_open()) {
    error = "cannot open config dump file: " + options.dump_path;
    return false;
  }
  dump.assign(std::istreambuf_iterator<char>(file),
              std::istreambuf_iterator<char>());
  if (file.bad()) {
    error = "failed to read config dump file: " + options.dump_path;
    return false;
  }
  return true;
}

}  // namespace

CliOptions parseArguments(int argc, const char* const argv[]) {
  CliOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    auto value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw UsageError("missing value for " + arg);
      }
      return argv[++i];
    };

    if (arg == "--help" || arg == "-h") {
      options.help = true;
    } else if (arg == "--config") {
      options.config_path = value();
    } else if (arg == "--file" || arg == "-f") {
      options.dump_path = value();
    } else if (arg == "--address") {
      options.address = value();
    } else if (arg == "--port") {
      options.port = parsePort(value());
    } else if (arg == "--type") {
      options.type = value();
    } else if (arg == "--output" || arg == "-o") {
      options.output = value();
    } else if (arg == "--log-level") {
      options.log_level = value();
    } else {
      throw UsageError("unknown option: " + arg);
    }
  }

  return options;
}

void printUsage(const char* program, std::ostream& out) {
  out << "Usage: " << program << " [options]\n\n";
  out << "Prints the listeners of a proxy config dump.\n\n";
  out << "Options:\n";
  out << "  --config <file>      JSON or YAML settings file (default: $"
      << config::kConfigPathEnv << ")\n";
  out << "  -f, --file <file>    Config dump to read, '-' for stdin (default: -)\n";
  out << "  --address <addr>     Only listeners bound to this address\n";
  out << "  --port <port>        Only listeners bound to this port\n";
  out << "  --type <type>        Only listeners of this type: HTTP, TCP, HTTP+TCP, UNKNOWN\n";
  out << "  -o, --output <fmt>   Output format: short, json (default: short)\n";
  out << "  --log-level <level>  Diagnostic log level (default: warning)\n";
  out << "  -h, --help           Show this help message\n";
}

config::InspectorConfig loadConfig(const CliOptions& options) {
  config::InspectorConfig cfg;

  const std::string path = config::resolveConfigPath(options.config_path);
  if (!path.empty()) {
    cfg = config::InspectorConfig::fromFile(path);
  }

  if (options.address) cfg.address = *options.address;
  if (options.port) cfg.port = *options.port;
  if (options.type) cfg.type = *options.type;
  if (options.output) cfg.output = *options.output;
  if (options.log_level) cfg.log_level = *options.log_level;

  cfg.validate();
  return cfg;
}

void configureLogging(const config::InspectorConfig& cfg) {
  auto& registry = logging::LoggerRegistry::instance();

  std::shared_ptr<logging::LogSink> sink =
      logging::SinkFactory::createStdioSink(true);
  if (cfg.log_format == "json") {
    sink->setFormatter(std::make_unique<logging::JsonFormatter>());
  }
  registry.setSink(sink);
  registry.setGlobalLevel(logging::stringToLogLevel(cfg.log_level));
}

int runInspector(const CliOptions& options,
                 std::istream& in,
                 std::ostream& out,
                 std::ostream& err) {
  config::InspectorConfig cfg;
  try {
    cfg = loadConfig(options);
  } catch (const config::ConfigValidationError& e) {
    err << "Error: " << e.what() << std::endl;
    return kExitFailure;
  }

  configureLogging(cfg);
  COMPONENT_LOG(Cli, Debug, "output={} filter=[address={} port={} type={}]",
                cfg.output, cfg.address, cfg.port, cfg.type);

  std::string dump;
  std::string read_error;
  if (!readDump(options, in, dump, read_error)) {
    err << "Error: " << read_error << std::endl;
    return kExitFailure;
  }

  configdump::ConfigWriter writer(out);
  VoidResult result = writer.prime(dump);
  if (is_success(result)) {
    const configdump::ListenerFilter filter = cfg.filter();
    result = (cfg.output == "json") ? writer.printListenerDump(filter)
                                    : writer.printListenerSummary(filter);
  }

  if (is_error(result)) {
    const Error* error = get_error(result);
    DUMPSCOPE_LOG(Debug, "inspection failed with {}",
                  errorCodeToString(error->code));
    err << "Error: " << error->message << std::endl;
    return kExitFailure;
  }

  return kExitSuccess;
}

}  // namespace cli
}  // namespace dumpscope

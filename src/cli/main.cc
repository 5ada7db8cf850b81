#include <iostream>

#include "dumpscope/cli/cli_options.h"

using namespace dumpscope;

int main(int argc, char* argv[]) {
  cli::CliOptions options;
  try {
    options = cli::parseArguments(argc, argv);
  } catch (const cli::UsageError& e) {
    std::cerr << "Error: " << e.what() << "\n\n";
    cli::printUsage(argv[0], std::cerr);
    return cli::kExitUsage;
  }

  if (options.help) {
    cli::printUsage(argv[0], std::cout);
    return cli::kExitSuccess;
  }

  return cli::runInspector(options, std::cin, std::cout, std::cerr);
}

#include "driver/Driver.h"
#include "cli/ParseArgs.h"
#include "cli/Usage.h"
#include <exception>
#include <iostream>
/***
 * Name: puretop::main
 * Purpose: CLI entry point for puretop.
 * Inputs:
 *   - argv
 * Outputs:
 *   - Exit status: 0 success, 1 parse or I/O failure, 2 usage or configuration error
 * Theory of Operation:
 *   Parse args then invoke Driver::run.
 */
int main(const int argc, char** argv) {
  try {
    puretop::cli::Options opts;
    if (!puretop::cli::ParseArgs(argc, argv, opts)) {
      std::cerr << puretop::cli::Usage();
      return 2;
    }
    if (opts.showHelp) {
      std::cout << puretop::cli::Usage();
      return 0;
    }
    return puretop::Driver::run(opts);
  } catch (const std::exception& ex) {
    std::cerr << "puretop: unhandled exception: " << ex.what() << "\n";
    return 1;
  }
}

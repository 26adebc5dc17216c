#include "driver/Driver.h"
#include "cli/Options.h"
#include "cli/ParseArgs.h"
#include "cli/Usage.h"
#include <exception>
#include <iostream>
/***
 * Name: sasstree::main
 * Purpose: CLI entry point for sasstree.
 * Inputs:
 *   - argv
 * Outputs:
 *   - Exit status: 0 success, 1 parse error, 2 usage or internal error
 * Theory of Operation:
 *   Parse args then invoke Driver::run.
 */
int main(const int argc, char** argv) {
  try {
    sasstree::cli::Options opts;
    if (!sasstree::cli::ParseArgs(argc, argv, opts)) {
      std::cerr << sasstree::cli::Usage();
      return 2;
    }
    if (opts.showHelp) {
      std::cout << sasstree::cli::Usage();
      return 0;
    }
    return sasstree::driver::Driver::run(opts);
  } catch (const std::exception& ex) {
    std::cerr << "sasstree: internal error: " << ex.what() << "\n";
    return 2;
  }
}

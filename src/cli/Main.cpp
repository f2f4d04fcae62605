#include "driver/App.h"
#include "cli/ParseArgs.h"
#include "cli/Usage.h"
#include "cmfmt/exceptions/cmfmt_exception.h"
#include <exception>
#include <iostream>
/***
 * Name: cmfmt::main
 * Purpose: CLI entry point for the cmfmt listfile tool.
 * Inputs:
 *   - argv
 * Outputs:
 *   - Exit status
 * Theory of Operation:
 *   Parse args then invoke App::run.
 */
int main(const int argc, char** argv) {
  try {
    cmfmt::cli::Options opts;
    if (!cmfmt::cli::ParseArgs(argc, argv, opts)) {
      std::cerr << "cmfmt: argument parse error\n";
      std::cerr << cmfmt::cli::Usage();
      return 2;
    }
    if (opts.showHelp) {
      std::cout << cmfmt::cli::Usage();
      return 0;
    }
    return cmfmt::App::run(opts);
  } catch (const cmfmt::exceptions::CmfmtException& ex) {
    std::cerr << "cmfmt: " << ex.what() << "\n";
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "cmfmt: internal error: " << ex.what() << "\n";
    return 1;
  }
}

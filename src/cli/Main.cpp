#include "cli/AstDump.h"
#include "cli/ParseArgs.h"
#include "cli/Usage.h"
#include "pyrite/exceptions/pyrite_exception.h"
#include <exception>
#include <iostream>
/***
 * Name: pyrite-astdump main
 * Purpose: CLI entry point for the AST dump tool.
 * Inputs:
 *   - argv
 * Outputs:
 *   - Exit status: 0 parsed, 1 syntax or file errors, 2 usage errors
 * Theory of Operation:
 *   Parse args then invoke RunAstDump.
 */
int main(const int argc, char** argv) {
  try {
    pyrite::cli::Options opts;
    if (!pyrite::cli::ParseArgs(argc, argv, opts)) {
      std::cerr << pyrite::cli::Usage();
      return 2;
    }
    if (opts.showHelp) {
      std::cout << pyrite::cli::Usage();
      return 0;
    }
    if (opts.inputs.size() != 1) {
      std::cerr << "pyrite-astdump: error: exactly one input file is required\n";
      std::cerr << pyrite::cli::Usage();
      return 2;
    }
    return pyrite::cli::RunAstDump(opts, std::cout, std::cerr);
  } catch (const pyrite::exceptions::PyriteException& ex) {
    std::cerr << "pyrite-astdump: " << ex.what() << '\n';
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "pyrite-astdump: internal error: " << ex.what() << '\n';
    return 1;
  }
}

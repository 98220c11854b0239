/***
 * Name: pyrite::cli::RunAstDump
 * Purpose: Body of the pyrite-astdump tool: read one file, parse it and
 *   print the tree (and optionally tokens and metrics).
 * Inputs:
 *   - opts: parsed command line (exactly one input)
 *   - out: receives tokens, the AST dump and metrics
 *   - err: receives diagnostics
 * Outputs: Process exit status (0 parsed, 1 syntax errors)
 * Theory of Operation: File read failures throw exceptions::FileReadError;
 *   syntax errors are rendered with FormatError and reported via status.
 */
#pragma once

#include <ostream>
#include "cli/Options.h"

namespace pyrite::cli {

    int RunAstDump(const Options& opts, std::ostream& out, std::ostream& err);

} // namespace pyrite::cli

/***
 * Name: pyrite::parse::FormatError
 * Purpose: Render a ParseError as `file:line:col: kind: message`, followed by
 *   the offending source line and a caret under the reported column.
 * Inputs:
 *   - error: the diagnostic
 *   - source: full source text the error refers to (may be empty)
 *   - tabWidth: tab stops used when echoing the line
 * Outputs: Rendered text without a trailing newline
 */
#pragma once

#include <string>
#include <vector>
#include "parser/ParseError.h"

namespace pyrite::parse {

std::string FormatError(const ParseError& error, const std::string& source, int tabWidth = 8);

// One rendered error per line group, separated by newlines
std::string FormatErrors(const std::vector<ParseError>& errors, const std::string& source, int tabWidth = 8);

} // namespace pyrite::parse

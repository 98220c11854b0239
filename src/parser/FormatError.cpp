/***
 * Name: pyrite::parse::FormatError
 * Purpose: Human-readable diagnostics with source context.
 * Theory of Operation: Columns count code points. Tabs in the echoed line are
 *   expanded to spaces so the caret lines up regardless of terminal tab stops.
 */
#include "parser/FormatError.h"

#include <cstddef>
#include <sstream>
#include <string_view>
#include "pyrite/support/utf8.h"

namespace pyrite::parse {

namespace {

// Line n (1-based) of source without its terminator; false when out of range.
// "\r\n", a bare "\r" and "\n" each end a line, matching the lexer.
bool sourceLine(const std::string& source, const int n, std::string_view& out) {
  if (n < 1) return false;
  size_t begin = 0;
  for (int i = 1; i < n; ++i) {
    const size_t eol = source.find_first_of("\r\n", begin);
    if (eol == std::string::npos) return false;
    begin = eol + 1;
    if (source[eol] == '\r' && begin < source.size() && source[begin] == '\n') ++begin;
  }
  if (begin >= source.size()) return false;
  size_t end = source.find_first_of("\r\n", begin);
  if (end == std::string::npos) end = source.size();
  out = std::string_view(source).substr(begin, end - begin);
  return true;
}

} // namespace

std::string FormatError(const ParseError& error, const std::string& source, const int tabWidth) {
  std::ostringstream out;
  out << (error.file.empty() ? "<input>" : error.file) << ":" << error.line << ":" << error.col << ": "
      << to_string(error.kind) << ": " << error.message;

  std::string_view line;
  if (!sourceLine(source, error.line, line)) return out.str();

  const int width = tabWidth > 0 ? tabWidth : 8;
  std::string echoed;
  std::string caret;
  int column = 0; // visual column
  int codePoint = 1;
  size_t pos = 0;
  while (pos < line.size()) {
    const size_t start = pos;
    const int cp = support::DecodeUtf8(line, pos);
    if (pos == start) ++pos;
    const int advance = cp == '\t' ? width - (column % width) : 1;
    if (cp == '\t') {
      echoed.append(static_cast<size_t>(advance), ' ');
    } else {
      echoed.append(line.substr(start, pos - start));
    }
    if (codePoint < error.col) caret.append(static_cast<size_t>(advance), ' ');
    column += advance;
    ++codePoint;
  }
  // error past the end of the line (e.g. at the newline)
  if (codePoint < error.col) caret.append(static_cast<size_t>(error.col - codePoint), ' ');
  caret.push_back('^');
  out << "\n" << echoed << "\n" << caret;
  return out.str();
}

std::string FormatErrors(const std::vector<ParseError>& errors, const std::string& source, const int tabWidth) {
  std::string out;
  for (const auto& error : errors) {
    if (!out.empty()) out += "\n";
    out += FormatError(error, source, tabWidth);
  }
  return out;
}

} // namespace pyrite::parse

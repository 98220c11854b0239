/***
 * Name: pyrite::lex::Lexer (numbers)
 * Purpose: Scan integer, float and imaginary literals.
 * Theory of Operation:
 *   Digit runs are collected with '_' separators removed. A separator must sit
 *   between two digits of the run; anything else is reported once per literal.
 *   Integers keep unbounded precision through support::BigInt. A malformed
 *   literal still yields a best-effort numeric token so parsing can continue.
 */
#include "lexer/Lexer.h"
#include <cctype>
#include <cstdlib>
#include <string>
#include "pyrite/support/big_int.h"

namespace pyrite::lex {

namespace {
bool isDecDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
bool isHexDigit(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }
bool isBinDigit(char c) { return c == '0' || c == '1'; }
bool isOctDigit(char c) { return c >= '0' && c <= '7'; }
bool isWordChar(char c) { return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_'; }
} // namespace

void Lexer::scanDigitRun(bool (*isDigit)(char), const char* kind, std::string& digits, std::string& problem) {
  auto flag = [&]() {
    if (problem.empty()) { problem = std::string("invalid ") + kind + " literal"; }
  };
  if (cur() == '_') { flag(); }
  for (;;) {
    const char chr = cur();
    if (!atEnd() && isDigit(chr)) {
      digits.push_back(chr);
      advance();
      continue;
    }
    if (chr == '_') {
      advance();
      // doubled or trailing separator
      if (atEnd() || !isDigit(cur())) { flag(); }
      continue;
    }
    break;
  }
}

void Lexer::skipIdentifierTail() {
  while (!atEnd() && isWordChar(cur())) { advance(); }
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
void Lexer::scanNumber() {
  const size_t start = pos_;
  const int line = line_;
  const int col = col_;
  std::string problem;
  auto note = [&](const std::string& msg) {
    if (problem.empty()) { problem = msg; }
  };

  // Base prefixes 0b/0o/0x
  const char marker = static_cast<char>(std::tolower(static_cast<unsigned char>(cur(1))));
  if (cur() == '0' && (marker == 'x' || marker == 'o' || marker == 'b')) {
    int base = 16;
    const char* name = "hexadecimal";
    bool (*isDigit)(char) = isHexDigit;
    if (marker == 'o') { base = 8; name = "octal"; isDigit = isOctDigit; }
    if (marker == 'b') { base = 2; name = "binary"; isDigit = isBinDigit; }
    advance();
    advance();
    std::string digits;
    scanDigitRun(isDigit, name, digits, problem);
    if (digits.empty()) { note(std::string("invalid ") + name + " literal"); }
    if (!atEnd() && isWordChar(cur())) {
      if (isDecDigit(cur())) {
        note(std::string("invalid digit '") + cur() + "' in " + name + " literal");
      } else {
        note(std::string("invalid ") + name + " literal");
      }
      skipIdentifierTail();
    }
    Token& tok = emit(TokenKind::Int, start, line, col);
    support::BigInt value;
    if (!digits.empty() && !support::BigInt::fromDigits(digits, base, value)) { value = support::BigInt(); }
    tok.value = value;
    if (!problem.empty()) { error(LexErrorKind::InvalidSyntax, line, col, problem); }
    return;
  }

  std::string intPart;
  std::string fracPart;
  std::string expPart;
  bool isFloat = false;
  if (cur() != '.') { scanDigitRun(isDecDigit, "decimal", intPart, problem); }
  if (cur() == '.') {
    isFloat = true;
    advance();
    if (isDecDigit(cur())) { scanDigitRun(isDecDigit, "decimal", fracPart, problem); }
    // 1.2.3
    if (cur() == '.' && isDecDigit(cur(1))) {
      note("invalid decimal literal");
      while (!atEnd() && (isDecDigit(cur()) || cur() == '.' || cur() == '_')) { advance(); }
    }
  }
  const char sign = cur(1);
  if ((cur() == 'e' || cur() == 'E') &&
      (isDecDigit(sign) || ((sign == '+' || sign == '-') && isDecDigit(cur(2))))) {
    isFloat = true;
    advance();
    if (cur() == '+' || cur() == '-') {
      expPart.push_back(cur());
      advance();
    }
    scanDigitRun(isDecDigit, "decimal", expPart, problem);
  }
  bool imag = false;
  if (cur() == 'j' || cur() == 'J') {
    imag = true;
    advance();
  }
  if (!atEnd() && isWordChar(cur())) {
    note("invalid decimal literal");
    skipIdentifierTail();
  }
  if (!isFloat && !imag && intPart.size() > 1 && intPart[0] == '0' &&
      intPart.find_first_not_of('0') != std::string::npos) {
    note("leading zeros in decimal integer literals are not permitted; use an 0o prefix for octal integers");
  }

  const TokenKind kind = imag ? TokenKind::Imag : (isFloat ? TokenKind::Float : TokenKind::Int);
  Token& tok = emit(kind, start, line, col);
  if (kind == TokenKind::Int) {
    support::BigInt value;
    if (!support::BigInt::fromDigits(intPart, 10, value)) { value = support::BigInt(); }
    tok.value = value;
  } else {
    std::string clean = (intPart.empty() ? "0" : intPart) + "." + (fracPart.empty() ? "0" : fracPart);
    if (!expPart.empty() && expPart != "+" && expPart != "-") { clean += "e" + expPart; }
    tok.value = std::strtod(clean.c_str(), nullptr);
  }
  if (!problem.empty()) { error(LexErrorKind::InvalidSyntax, line, col, problem); }
}

} // namespace pyrite::lex

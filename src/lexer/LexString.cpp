/***
 * Name: pyrite::lex::Lexer (strings)
 * Purpose: Scan string, bytes and f-string literals and decode their payloads.
 * Theory of Operation:
 *   scanString locates the closing delimiter (single or triple quoted) without
 *   interpreting escapes beyond skipping the escaped character. The body is
 *   then decoded: escape processing for str/bytes, or splitting into literal
 *   and {expression} parts for f-strings. Expression parts keep their source
 *   text and position so the parser can re-lex and parse them in place.
 */
#include "lexer/Lexer.h"
#include <unicode/uchar.h>
#include <cctype>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "pyrite/support/utf8.h"

namespace pyrite::lex {

namespace {

constexpr int kMaxSpecNesting = 2;

bool isHex(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }
bool isOct(char c) { return c >= '0' && c <= '7'; }

int hexValue(char c) {
  if (c >= '0' && c <= '9') { return c - '0'; }
  return (std::tolower(static_cast<unsigned char>(c)) - 'a') + 10;
}

std::string normalizeNewlines(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\r') {
      out.push_back('\n');
      if (i + 1 < text.size() && text[i + 1] == '\n') { ++i; }
      continue;
    }
    out.push_back(text[i]);
  }
  return out;
}

// Walks an f-string body and splits it into literal and replacement-field parts.
class FStringSplitter {
 public:
  using Report = std::function<void(int, int, const std::string&)>;
  using Decode = std::function<std::string(std::string_view, int, int)>;

  FStringSplitter(std::string_view body, int line, int col, bool raw, Report report, Decode decode)
      : s_(body), line_(line), col_(col), raw_(raw), report_(std::move(report)), decode_(std::move(decode)) {}

  std::vector<FStringPart> split() { return parts(0, false); }

 private:
  std::string_view s_;
  size_t i_{0};
  int line_;
  int col_;
  bool raw_;
  Report report_;
  Decode decode_;

  char at(size_t k = 0) const { return i_ + k < s_.size() ? s_[i_ + k] : '\0'; }
  bool done() const { return i_ >= s_.size(); }
  void step() {
    if (done()) { return; }
    const char chr = s_[i_++];
    if (chr == '\n') { ++line_; col_ = 1; return; }
    if ((static_cast<unsigned char>(chr) & 0xC0U) != 0x80U) { ++col_; }
  }

  // Parses parts until the end of the body, or an unmatched '}' inside a format spec.
  // NOLINTNEXTLINE(readability-function-cognitive-complexity)
  std::vector<FStringPart> parts(int depth, bool inSpec) {
    std::vector<FStringPart> out;
    std::string lit;
    int litLine = line_;
    int litCol = col_;
    auto append = [&](char chr) {
      if (lit.empty()) { litLine = line_; litCol = col_; }
      lit.push_back(chr);
    };
    auto flush = [&]() {
      if (lit.empty()) { return; }
      FStringPart part;
      part.text = decode_(lit, litLine, litCol);
      part.line = litLine;
      part.col = litCol;
      out.push_back(std::move(part));
      lit.clear();
    };
    while (!done()) {
      const char chr = at();
      if (chr == '{') {
        if (at(1) == '{' && !inSpec) {
          append('{');
          step(); step();
          continue;
        }
        flush();
        FStringPart field;
        if (replacementField(field, depth)) { out.push_back(std::move(field)); }
        continue;
      }
      if (chr == '}') {
        if (inSpec) { break; }
        if (at(1) == '}') {
          append('}');
          step(); step();
          continue;
        }
        report_(line_, col_, "f-string: single '}' is not allowed");
        step();
        continue;
      }
      // an escaped backslash cannot start \N{...}
      if (chr == '\\' && !raw_ && at(1) == '\\') {
        append(chr);
        step();
        append(at());
        step();
        continue;
      }
      // \N{NAME} braces belong to the escape, not to a replacement field
      if (chr == '\\' && !raw_ && at(1) == 'N' && at(2) == '{') {
        while (!done() && at() != '}') { append(at()); step(); }
        if (!done()) { append('}'); step(); }
        continue;
      }
      append(chr);
      step();
    }
    flush();
    return out;
  }

  void skipQuoted() {
    const char quote = at();
    const bool triple = at(1) == quote && at(2) == quote;
    for (int n = 0; n < (triple ? 3 : 1); ++n) { step(); }
    while (!done()) {
      if (at() == '\\') { step(); step(); continue; }
      if (at() == quote && (!triple || (at(1) == quote && at(2) == quote))) {
        for (int n = 0; n < (triple ? 3 : 1); ++n) { step(); }
        return;
      }
      step();
    }
  }

  void skipToClose() {
    int nest = 0;
    while (!done()) {
      const char chr = at();
      if (chr == '{') { ++nest; }
      if (chr == '}') {
        if (nest == 0) { step(); return; }
        --nest;
      }
      step();
    }
  }

  // {expr[=][!conv][:spec]} starting at '{'
  // NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
  bool replacementField(FStringPart& field, int depth) {
    const int openLine = line_;
    const int openCol = col_;
    step();
    if (depth >= kMaxSpecNesting) {
      report_(openLine, openCol, "f-string: expressions nested too deeply");
      skipToClose();
      return false;
    }
    const size_t exprStart = i_;
    const int exprLine = line_;
    const int exprCol = col_;
    int nest = 0;
    bool selfDoc = false;
    while (!done()) {
      const char chr = at();
      if (chr == '\'' || chr == '"') { skipQuoted(); continue; }
      if (chr == '(' || chr == '[' || chr == '{') { ++nest; step(); continue; }
      if (nest > 0 && (chr == ')' || chr == ']' || chr == '}')) { --nest; step(); continue; }
      if (nest == 0) {
        if (chr == '}' || chr == ':') { break; }
        if (chr == '!' && at(1) != '=') { break; }
        if (chr == '=' && at(1) != '=' && i_ > exprStart) {
          const char prev = s_[i_ - 1];
          if (prev != '=' && prev != '!' && prev != '<' && prev != '>') {
            size_t k = 1;
            while (at(k) == ' ' || at(k) == '\t' || at(k) == '\n') { ++k; }
            const char after = at(k);
            if (after == '}' || after == '!' || after == ':') {
              selfDoc = true;
              break;
            }
          }
        }
        if (chr == '#') {
          report_(line_, col_, "f-string expression part cannot include '#'");
        }
      }
      step();
    }
    if (done()) {
      report_(openLine, openCol, "f-string: expecting '}'");
      return false;
    }
    const std::string expr(s_.substr(exprStart, i_ - exprStart));
    if (expr.find_first_not_of(" \t\n") == std::string::npos) {
      report_(openLine, openCol, "f-string: valid expression required before '}'");
      skipToClose();
      return false;
    }
    field.isExpr = true;
    field.text = expr;
    field.line = exprLine;
    field.col = exprCol;
    if (selfDoc) {
      step();
      while (at() == ' ' || at() == '\t' || at() == '\n') { step(); }
      field.selfDocumenting = true;
      field.selfDocText = std::string(s_.substr(exprStart, i_ - exprStart));
    }
    if (at() == '!') {
      step();
      const char conv = at();
      if (conv == 'r' || conv == 's' || conv == 'a') {
        field.conversion = conv;
        step();
      } else {
        report_(line_, col_, "f-string: invalid conversion character: expected 's', 'r', or 'a'");
        if (!done() && at() != '}' && at() != ':') { step(); }
      }
    }
    if (at() == ':') {
      step();
      field.spec = parts(depth + 1, true);
    }
    if (at() != '}') {
      report_(openLine, openCol, "f-string: expecting '}'");
      skipToClose();
      return false;
    }
    step();
    return true;
  }
};

} // namespace

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Lexer::scanString(size_t start, int line, int col, std::string_view prefix) {
  StringFlags flags;
  for (const char chr : prefix) {
    switch (std::tolower(static_cast<unsigned char>(chr))) {
      case 'r': flags.raw = true; break;
      case 'b': flags.bytes = true; break;
      case 'f': flags.format = true; break;
      default: break;
    }
  }
  const char quote = cur();
  flags.quote = quote;
  flags.triple = cur(1) == quote && cur(2) == quote;
  const int quoteLine = line_;
  const int quoteCol = col_;
  const int delim = flags.triple ? 3 : 1;
  for (int n = 0; n < delim; ++n) { advance(); }

  const size_t bodyStart = pos_;
  const int bodyLine = line_;
  const int bodyCol = col_;
  size_t bodyEnd = std::string::npos;
  while (!atEnd()) {
    const char chr = cur();
    if (chr == '\\') {
      advance();
      advance();
      continue;
    }
    if (!flags.triple && (chr == '\n' || chr == '\r')) { break; }
    if (chr == quote && (!flags.triple || (cur(1) == quote && cur(2) == quote))) {
      bodyEnd = pos_;
      for (int n = 0; n < delim; ++n) { advance(); }
      break;
    }
    advance();
  }
  if (bodyEnd == std::string::npos) {
    bodyEnd = pos_;
    error(LexErrorKind::UnterminatedLiteral, quoteLine, quoteCol,
          flags.triple ? "unterminated triple-quoted string literal" : "unterminated string literal");
  }

  const std::string body = normalizeNewlines(std::string_view(src_).substr(bodyStart, bodyEnd - bodyStart));
  if (flags.format) {
    FStringPayload payload;
    payload.flags = flags;
    payload.parts = splitFString(body, bodyLine, bodyCol, flags);
    Token& tok = emit(TokenKind::FString, start, line, col);
    tok.value = std::move(payload);
    return;
  }
  StringPayload payload;
  payload.flags = flags;
  payload.value = decodeEscapes(body, bodyLine, bodyCol, flags);
  Token& tok = emit(flags.bytes ? TokenKind::Bytes : TokenKind::String, start, line, col);
  tok.value = std::move(payload);
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
std::string Lexer::decodeEscapes(std::string_view body, int line, int col, const StringFlags& flags) {
  std::string out;
  out.reserve(body.size());
  size_t idx = 0;
  int curLine = line;
  int curCol = col;
  bool reportedNonAscii = false;
  auto step = [&](size_t count) {
    for (size_t n = 0; n < count && idx < body.size(); ++n) {
      const char chr = body[idx++];
      if (chr == '\n') { ++curLine; curCol = 1; }
      else if ((static_cast<unsigned char>(chr) & 0xC0U) != 0x80U) { ++curCol; }
    }
  };
  auto readHex = [&](size_t count, long& value) {
    value = 0;
    for (size_t n = 0; n < count; ++n) {
      if (idx >= body.size() || !isHex(body[idx])) { return false; }
      value = (value * 16) + hexValue(body[idx]);
      step(1);
    }
    return true;
  };

  while (idx < body.size()) {
    const char chr = body[idx];
    if (flags.bytes && static_cast<unsigned char>(chr) >= 0x80) {
      if (!reportedNonAscii) {
        error(LexErrorKind::InvalidSyntax, curLine, curCol, "bytes can only contain ASCII literal characters");
        reportedNonAscii = true;
      }
      out.push_back(chr);
      step(1);
      continue;
    }
    if (chr != '\\' || flags.raw || idx + 1 >= body.size()) {
      out.push_back(chr);
      step(1);
      continue;
    }
    const int escLine = curLine;
    const int escCol = curCol;
    const char esc = body[idx + 1];
    step(2);
    switch (esc) {
      case '\n': break; // line continuation inside the literal
      case '\\': out.push_back('\\'); break;
      case '\'': out.push_back('\''); break;
      case '"': out.push_back('"'); break;
      case 'a': out.push_back('\a'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'v': out.push_back('\v'); break;
      case '0': case '1': case '2': case '3': case '4': case '5': case '6': case '7': {
        long value = esc - '0';
        for (int n = 1; n < 3 && idx < body.size() && isOct(body[idx]); ++n) {
          value = (value * 8) + (body[idx] - '0');
          step(1);
        }
        if (flags.bytes) {
          if (value > 0xFF) {
            error(LexErrorKind::InvalidSyntax, escLine, escCol, "invalid octal escape sequence in bytes literal");
          } else {
            out.push_back(static_cast<char>(value));
          }
        } else {
          support::AppendUtf8(out, value);
        }
        break;
      }
      case 'x': {
        long value = 0;
        if (!readHex(2, value)) {
          error(LexErrorKind::InvalidSyntax, escLine, escCol, "truncated \\xXX escape");
          break;
        }
        if (flags.bytes) { out.push_back(static_cast<char>(value)); }
        else { support::AppendUtf8(out, value); }
        break;
      }
      case 'u':
      case 'U': {
        if (flags.bytes) {
          out.push_back('\\');
          out.push_back(esc);
          break;
        }
        const size_t count = esc == 'u' ? 4 : 8;
        long value = 0;
        if (!readHex(count, value)) {
          error(LexErrorKind::InvalidSyntax, escLine, escCol,
                esc == 'u' ? "truncated \\uXXXX escape" : "truncated \\UXXXXXXXX escape");
          break;
        }
        if (!support::AppendUtf8(out, value)) {
          error(LexErrorKind::InvalidSyntax, escLine, escCol, "illegal Unicode character in \\U escape");
        }
        break;
      }
      case 'N': {
        if (flags.bytes) {
          out.push_back('\\');
          out.push_back('N');
          break;
        }
        const size_t close = body.find('}', idx);
        if (idx >= body.size() || body[idx] != '{' || close == std::string_view::npos || close == idx + 1) {
          error(LexErrorKind::InvalidSyntax, escLine, escCol, "malformed \\N character escape");
          break;
        }
        const std::string name(body.substr(idx + 1, close - idx - 1));
        step(close - idx + 1);
        UErrorCode status = U_ZERO_ERROR;
        UChar32 codepoint = u_charFromName(U_UNICODE_CHAR_NAME, name.c_str(), &status);
        if (U_FAILURE(status)) {
          status = U_ZERO_ERROR;
          codepoint = u_charFromName(U_CHAR_NAME_ALIAS, name.c_str(), &status);
        }
        if (U_FAILURE(status)) {
          error(LexErrorKind::InvalidSyntax, escLine, escCol, "unknown Unicode character name '" + name + "'");
          break;
        }
        support::AppendUtf8(out, codepoint);
        break;
      }
      default:
        // unrecognized escapes are kept verbatim
        out.push_back('\\');
        out.push_back(esc);
        break;
    }
  }
  return out;
}

std::vector<FStringPart> Lexer::splitFString(std::string_view body, int line, int col, const StringFlags& flags) {
  FStringSplitter splitter(
      body, line, col, flags.raw,
      [this](int errLine, int errCol, const std::string& msg) {
        error(LexErrorKind::InvalidSyntax, errLine, errCol, msg);
      },
      [this, &flags](std::string_view text, int textLine, int textCol) {
        return decodeEscapes(text, textLine, textCol, flags);
      });
  return splitter.split();
}

} // namespace pyrite::lex

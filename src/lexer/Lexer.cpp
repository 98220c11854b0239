/***
 * Name: pyrite::lex::Lexer
 * Purpose: Tokenize a source buffer: layout (NEWLINE/INDENT/DEDENT), operators,
 *   identifiers and keywords. Literals live in LexNumber.cpp and LexString.cpp.
 */
#include "lexer/Lexer.h"
#include <unicode/uchar.h>
#include <cctype>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>
#include "pyrite/support/utf8.h"

namespace pyrite::lex {

namespace {

bool isIdentStart(char chr) { return (std::isalpha(static_cast<unsigned char>(chr)) != 0) || chr == '_'; }
bool isIdentChar(char chr) { return (std::isalnum(static_cast<unsigned char>(chr)) != 0) || chr == '_'; }
bool isNonAscii(char chr) { return static_cast<unsigned char>(chr) >= 0x80; }

const std::unordered_map<std::string_view, TokenKind>& keywordTable() {
  using enum TokenKind;
  static const std::unordered_map<std::string_view, TokenKind> table{
      {"False", False}, {"None", None}, {"True", True}, {"and", And}, {"as", As},
      {"assert", Assert}, {"async", Async}, {"await", Await}, {"break", Break},
      {"class", Class}, {"continue", Continue}, {"def", Def}, {"del", Del},
      {"elif", Elif}, {"else", Else}, {"except", Except}, {"finally", Finally},
      {"for", For}, {"from", From}, {"global", Global}, {"if", If}, {"import", Import},
      {"in", In}, {"is", Is}, {"lambda", Lambda}, {"nonlocal", Nonlocal}, {"not", Not},
      {"or", Or}, {"pass", Pass}, {"raise", Raise}, {"return", Return}, {"try", Try},
      {"while", While}, {"with", With}, {"yield", Yield}};
  return table;
}

struct OperatorSpelling {
  std::string_view text;
  TokenKind kind;
};

// Longest spellings first so the first match is the maximal munch.
constexpr OperatorSpelling kOperators[] = {
    {"**=", TokenKind::StarStarEqual}, {"//=", TokenKind::SlashSlashEqual},
    {">>=", TokenKind::RShiftEqual}, {"<<=", TokenKind::LShiftEqual},
    {"...", TokenKind::Ellipsis},
    {"**", TokenKind::StarStar}, {"//", TokenKind::SlashSlash}, {">>", TokenKind::RShift},
    {"<<", TokenKind::LShift}, {"<=", TokenKind::Le}, {">=", TokenKind::Ge},
    {"==", TokenKind::EqEq}, {"!=", TokenKind::NotEq}, {"->", TokenKind::Arrow},
    {":=", TokenKind::ColonEqual}, {"+=", TokenKind::PlusEqual}, {"-=", TokenKind::MinusEqual},
    {"*=", TokenKind::StarEqual}, {"/=", TokenKind::SlashEqual}, {"%=", TokenKind::PercentEqual},
    {"@=", TokenKind::AtEqual}, {"&=", TokenKind::AmpEqual}, {"|=", TokenKind::PipeEqual},
    {"^=", TokenKind::CaretEqual},
    {"+", TokenKind::Plus}, {"-", TokenKind::Minus}, {"*", TokenKind::Star},
    {"/", TokenKind::Slash}, {"%", TokenKind::Percent}, {"@", TokenKind::At},
    {"&", TokenKind::Amp}, {"|", TokenKind::Pipe}, {"^", TokenKind::Caret},
    {"~", TokenKind::Tilde}, {"<", TokenKind::Lt}, {">", TokenKind::Gt},
    {"(", TokenKind::LParen}, {")", TokenKind::RParen}, {"[", TokenKind::LBracket},
    {"]", TokenKind::RBracket}, {"{", TokenKind::LBrace}, {"}", TokenKind::RBrace},
    {",", TokenKind::Comma}, {":", TokenKind::Colon}, {";", TokenKind::Semicolon},
    {".", TokenKind::Dot}, {"=", TokenKind::Equal}};

bool isStringPrefix(std::string_view prefix) {
  std::string lower;
  for (const char chr : prefix) { lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(chr)))); }
  return lower == "r" || lower == "u" || lower == "b" || lower == "f" || lower == "br" ||
         lower == "rb" || lower == "fr" || lower == "rf";
}

bool isPrefixLetter(char chr) {
  switch (chr) {
    case 'r': case 'R': case 'b': case 'B': case 'f': case 'F': case 'u': case 'U':
      return true;
    default:
      return false;
  }
}

std::string describeCodePoint(const std::string& utf8, int codepoint) {
  std::ostringstream oss;
  oss << "invalid character '" << utf8 << "' (U+" << std::uppercase << std::hex << std::setw(4)
      << std::setfill('0') << codepoint << ")";
  return oss.str();
}

} // namespace

Lexer::Lexer(std::string source, std::string file, LexerOptions options)
  : src_(std::move(source)), file_(std::move(file)), opts_(options) {
  if (opts_.tabWidth < 1) { opts_.tabWidth = 1; }
  line_ = opts_.startLine;
  col_ = opts_.startCol;
  atLineStart_ = !opts_.implicitJoin;
  indentStack_.push_back(IndentLevel{});
  // Skip a UTF-8 byte order mark.
  if (src_.size() >= 3 && src_.compare(0, 3, "\xEF\xBB\xBF") == 0) { pos_ = 3; }
}

char Lexer::cur(size_t ahead) const {
  const size_t idx = pos_ + ahead;
  return idx < src_.size() ? src_[idx] : '\0';
}

void Lexer::advance() {
  if (atEnd()) { return; }
  const char chr = src_[pos_++];
  if (chr == '\r') {
    if (pos_ < src_.size() && src_[pos_] == '\n') { ++pos_; }
    ++line_; col_ = 1;
    return;
  }
  if (chr == '\n') { ++line_; col_ = 1; return; }
  // columns count code points, not bytes
  if ((static_cast<unsigned char>(chr) & 0xC0U) != 0x80U) { ++col_; }
}

void Lexer::error(LexErrorKind kind, int line, int col, std::string message) {
  errors_.push_back(LexError{kind, std::move(message), file_, line, col});
}

Token& Lexer::emit(TokenKind kind, size_t start, int line, int col) {
  Token tok;
  tok.kind = kind;
  tok.text = src_.substr(start, pos_ - start);
  tok.file = file_;
  tok.line = line;
  tok.col = col;
  tok.endLine = line_;
  tok.endCol = col_;
  tokens_.push_back(std::move(tok));
  return tokens_.back();
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
bool Lexer::handleLineStart() {
  const size_t start = pos_;
  const int line = line_;
  int width = 0;
  int altWidth = 0;
  for (;;) {
    const char chr = cur();
    if (chr == ' ') { ++width; ++altWidth; }
    else if (chr == '\t') {
      width = (width / opts_.tabWidth + 1) * opts_.tabWidth;
      ++altWidth;
    } else if (chr == '\f') { width = 0; altWidth = 0; }
    else { break; }
    advance();
  }
  // Blank and comment-only lines never touch the indentation stack.
  if (atEnd() || cur() == '#' || atNewline()) {
    while (!atEnd() && !atNewline()) { advance(); }
    if (atNewline()) {
      advance();
      atLineStart_ = true;
    }
    return false;
  }

  const int textCol = col_;
  auto inconsistent = [&]() {
    error(LexErrorKind::InconsistentIndentation, line, textCol,
          "inconsistent use of tabs and spaces in indentation");
  };
  auto layoutToken = [&](TokenKind kind, const char* text) {
    Token& tok = emit(kind, start, line, 1);
    tok.text = text;
  };

  const IndentLevel& top = indentStack_.back();
  if (width == top.width) {
    if (altWidth != top.altWidth) { inconsistent(); }
  } else if (width > top.width) {
    if (altWidth <= top.altWidth) { inconsistent(); }
    indentStack_.push_back(IndentLevel{width, altWidth, false});
    layoutToken(TokenKind::Indent, "<INDENT>");
  } else {
    while (indentStack_.size() > 1 && width < indentStack_.back().width) {
      const bool silent = indentStack_.back().silent;
      indentStack_.pop_back();
      if (!silent) { layoutToken(TokenKind::Dedent, "<DEDENT>"); }
    }
    if (width != indentStack_.back().width) {
      error(LexErrorKind::InconsistentIndentation, line, textCol,
            "unindent does not match any outer indentation level");
      // Keep later lines at this width from opening a phantom block.
      indentStack_.push_back(IndentLevel{width, altWidth, true});
    } else if (altWidth != indentStack_.back().altWidth) {
      inconsistent();
    }
  }
  return true;
}

void Lexer::closeBlocks() {
  while (indentStack_.size() > 1) {
    const bool silent = indentStack_.back().silent;
    indentStack_.pop_back();
    if (!silent) {
      Token& tok = emit(TokenKind::Dedent, pos_, line_, col_);
      tok.text = "<DEDENT>";
    }
  }
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
void Lexer::buildAll() {
  if (finalized_) { return; }
  finalized_ = true;
  const bool layout = !opts_.implicitJoin;
  for (;;) {
    if (layout && atLineStart_ && brackets_.empty()) {
      atLineStart_ = false;
      if (!handleLineStart()) { continue; }
    }
    while (cur() == ' ' || cur() == '\t' || cur() == '\f') { advance(); }
    if (atEnd()) { break; }
    const char chr = cur();
    if (chr == '#') {
      while (!atEnd() && !atNewline()) { advance(); }
      continue;
    }
    if (chr == '\n' || chr == '\r') {
      if (layout && brackets_.empty()) {
        const size_t start = pos_;
        const int line = line_;
        const int col = col_;
        advance();
        Token& tok = emit(TokenKind::Newline, start, line, col);
        tok.endLine = line;
        tok.endCol = col + 1;
        atLineStart_ = true;
      } else {
        advance();
      }
      continue;
    }
    if (chr == '\\') {
      const int line = line_;
      const int col = col_;
      advance();
      if (atNewline()) { advance(); continue; }
      if (atEnd()) {
        error(LexErrorKind::InvalidSyntax, line, col, "unexpected end of file after line continuation character");
        break;
      }
      error(LexErrorKind::InvalidSyntax, line, col, "unexpected character after line continuation character");
      continue;
    }
    scanToken();
  }

  if (layout) {
    if (!tokens_.empty() && tokens_.back().kind != TokenKind::Newline) {
      Token& tok = emit(TokenKind::Newline, pos_, line_, col_);
      tok.text = "";
    }
    closeBlocks();
  }
  Token& eof = emit(TokenKind::End, pos_, line_, col_);
  eof.text = "<EOF>";
}

void Lexer::scanToken() {
  const char chr = cur();
  if ((std::isdigit(static_cast<unsigned char>(chr)) != 0) ||
      (chr == '.' && (std::isdigit(static_cast<unsigned char>(cur(1))) != 0))) {
    scanNumber();
    return;
  }
  if (chr == '"' || chr == '\'') {
    scanString(pos_, line_, col_, "");
    return;
  }
  if (isIdentStart(chr) || isNonAscii(chr)) {
    scanIdentifierOrString();
    return;
  }
  scanOperator();
}

void Lexer::scanOperator() {
  const size_t start = pos_;
  const int line = line_;
  const int col = col_;
  const std::string_view rest = std::string_view(src_).substr(pos_);
  for (const auto& op : kOperators) {
    if (rest.substr(0, op.text.size()) != op.text) { continue; }
    for (size_t i = 0; i < op.text.size(); ++i) { advance(); }
    switch (op.kind) {
      case TokenKind::LParen: brackets_.push_back('('); break;
      case TokenKind::LBracket: brackets_.push_back('['); break;
      case TokenKind::LBrace: brackets_.push_back('{'); break;
      case TokenKind::RParen:
      case TokenKind::RBracket:
      case TokenKind::RBrace:
        if (!brackets_.empty()) { brackets_.pop_back(); }
        break;
      default: break;
    }
    emit(op.kind, start, line, col);
    return;
  }
  advance();
  const std::string bad = src_.substr(start, pos_ - start);
  error(LexErrorKind::InvalidSyntax, line, col,
        describeCodePoint(bad, static_cast<unsigned char>(bad.front())));
  emit(TokenKind::Error, start, line, col);
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Lexer::scanIdentifierOrString() {
  const size_t start = pos_;
  const int line = line_;
  const int col = col_;

  size_t prefixLen = 0;
  while (prefixLen < 2 && isPrefixLetter(cur(prefixLen))) { ++prefixLen; }
  const char quote = cur(prefixLen);
  if (prefixLen > 0 && (quote == '"' || quote == '\'') &&
      isStringPrefix(std::string_view(src_).substr(pos_, prefixLen))) {
    const std::string prefix = src_.substr(pos_, prefixLen);
    for (size_t i = 0; i < prefixLen; ++i) { advance(); }
    scanString(start, line, col, prefix);
    return;
  }

  bool ascii = true;
  while (!atEnd()) {
    const char chr = cur();
    if (!isNonAscii(chr)) {
      if (!isIdentChar(chr)) { break; }
      advance();
      continue;
    }
    size_t next = pos_;
    const int codepoint = support::DecodeUtf8(src_, next);
    const UProperty property = (pos_ == start) ? UCHAR_XID_START : UCHAR_XID_CONTINUE;
    if (codepoint < 0 || u_hasBinaryProperty(codepoint, property) == 0) { break; }
    ascii = false;
    while (pos_ < next) { advance(); }
  }

  if (pos_ == start) {
    size_t next = pos_;
    const int codepoint = support::DecodeUtf8(src_, next);
    if (next == pos_) { ++next; }
    while (pos_ < next) { advance(); }
    const std::string bad = src_.substr(start, pos_ - start);
    error(LexErrorKind::InvalidSyntax, line, col,
          codepoint < 0 ? std::string("invalid UTF-8 sequence in source") : describeCodePoint(bad, codepoint));
    emit(TokenKind::Error, start, line, col);
    return;
  }

  TokenKind kind = TokenKind::Ident;
  if (ascii) {
    const auto& table = keywordTable();
    const auto found = table.find(std::string_view(src_).substr(start, pos_ - start));
    if (found != table.end()) { kind = found->second; }
  }
  Token& tok = emit(kind, start, line, col);
  if (!ascii) {
    std::string normalized;
    if (support::NormalizeNfkc(tok.text, normalized)) { tok.text = std::move(normalized); }
  }
}

const Token& Lexer::peek(size_t lookahead) {
  if (!finalized_) { buildAll(); }
  if (cursor_ + lookahead < tokens_.size()) {
    return tokens_[cursor_ + lookahead];
  }
  return tokens_.back();
}

Token Lexer::next() {
  if (!finalized_) { buildAll(); }
  if (cursor_ < tokens_.size()) {
    return tokens_[cursor_++];
  }
  return tokens_.back();
}

std::vector<LexError> Lexer::lexErrors() {
  if (!finalized_) { buildAll(); }
  return errors_;
}

const std::vector<Token>& Lexer::tokens() {
  if (!finalized_) { buildAll(); }
  return tokens_;
}

const std::vector<LexError>& Lexer::errors() {
  if (!finalized_) { buildAll(); }
  return errors_;
}

LexResult tokenize(const std::string& source, const std::string& file, LexerOptions options) {
  Lexer lexer(source, file, options);
  LexResult result;
  result.tokens = lexer.tokens();
  result.errors = lexer.errors();
  return result;
}

} // namespace pyrite::lex

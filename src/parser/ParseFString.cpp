/***
 * Name: pyrite::parse::Parser (string literals)
 * Purpose: Concatenate adjacent string tokens and build f-string nodes.
 * Theory of Operation:
 *   The lexer splits an f-string body into literal text and replacement
 *   fields, keeping each field's source text and position. Every field is
 *   parsed here by a nested Lexer/Parser pair positioned at the field, so
 *   diagnostics inside f-strings carry file coordinates. {expr=} is
 *   desugared into its echoed source text followed by the formatted value.
 */
#include "parser/Parser.h"

#include <string>
#include <utility>
#include <vector>
#include "lexer/Lexer.h"

namespace pyrite::parse {

using TK = lex::TokenKind;

namespace {

void appendText(std::vector<ast::FStringSegment>& out, const std::string& text) {
  if (text.empty()) return;
  if (!out.empty()) {
    if (auto* last = std::get_if<std::string>(&out.back())) {
      *last += text;
      return;
    }
  }
  out.emplace_back(text);
}

} // namespace

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
ast::ExprPtr Parser::parseStrings() {
  const lex::Token& first = peek();
  bool sawBytes = false;
  bool sawText = false;
  bool sawFormat = false;
  std::string joined;
  std::vector<ast::FStringSegment> segments;

  while (at(TK::String) || at(TK::Bytes) || at(TK::FString)) {
    const lex::Token& tok = get();
    const bool isBytes = tok.kind == TK::Bytes;
    if ((isBytes && sawText) || (!isBytes && sawBytes)) {
      errorAt(tok, ErrorKind::InvalidSyntax, "cannot mix bytes and nonbytes literals");
      return nullptr;
    }
    (isBytes ? sawBytes : sawText) = true;

    if (tok.kind == TK::FString) {
      sawFormat = true;
      const auto* payload = std::get_if<lex::FStringPayload>(&tok.value);
      if (payload && !appendFStringParts(payload->parts, segments)) return nullptr;
      continue;
    }
    const auto* payload = std::get_if<lex::StringPayload>(&tok.value);
    const std::string text = payload ? payload->value : std::string();
    joined += text;
    appendText(segments, text);
  }

  if (sawFormat) {
    ast::FStringLiteral literal;
    literal.segments = std::move(segments);
    return ast::makeExpr(std::move(literal), spanFrom(first));
  }
  ast::Constant constant;
  constant.kind = sawBytes ? ast::Constant::Kind::Bytes : ast::Constant::Kind::Str;
  constant.text = std::move(joined);
  return ast::makeExpr(std::move(constant), spanFrom(first));
}

bool Parser::appendFStringParts(const std::vector<lex::FStringPart>& parts,
                                std::vector<ast::FStringSegment>& out) {
  for (const auto& part : parts) {
    if (!part.isExpr) {
      appendText(out, part.text);
      continue;
    }
    if (part.selfDocumenting) appendText(out, part.selfDocText);
    ast::FormattedValue formatted;
    formatted.value = parseReplacementField(part);
    if (!formatted.value) return false;
    formatted.conversion = part.conversion;
    // {x=} defaults to repr unless a conversion or spec is given
    if (part.selfDocumenting && part.conversion == 0 && part.spec.empty()) formatted.conversion = 'r';
    if (!part.spec.empty()) {
      formatted.formatSpec = buildFormatSpec(part.spec, formatted.value->span);
      if (!formatted.formatSpec) return false;
    }
    out.emplace_back(std::move(formatted));
  }
  return true;
}

ast::ExprPtr Parser::parseReplacementField(const lex::FStringPart& part) {
  lex::LexerOptions lexOptions;
  lexOptions.startLine = part.line;
  lexOptions.startCol = part.col;
  lexOptions.implicitJoin = true;
  const std::string file = tokens_.empty() ? std::string() : tokens_.front().file;
  lex::Lexer lexer(part.text, file, lexOptions);

  ParserOptions options = opts_;
  options.maxNestingDepth = opts_.maxNestingDepth - depth_;
  Parser nested(lexer, options);
  ExprResult result = nested.parseExpressionInput();

  for (auto& err : result.errors) {
    if (err.lexical) {
      lexErrors_.push_back(std::move(err));
    } else {
      addError(err.kind, err.line, err.col, std::move(err.message), std::move(err.expected), std::move(err.found));
    }
  }
  if (!result.ok()) return nullptr;
  return std::move(result.expr);
}

ast::ExprPtr Parser::buildFormatSpec(const std::vector<lex::FStringPart>& parts, const ast::Span& span) {
  ast::FStringLiteral spec;
  if (!appendFStringParts(parts, spec.segments)) return nullptr;
  return ast::makeExpr(std::move(spec), span);
}

} // namespace pyrite::parse

/***
 * Name: pyrite::parse::Parser
 * Purpose: Build a Module AST from a token stream, accumulating errors.
 * Inputs:
 *   - Token stream (pull-based ITokenStream, usually a lex::Lexer)
 *   - ParserOptions (nesting bound)
 * Outputs:
 *   - ParseResult: module on success, otherwise the ordered error list
 *     (lexical errors first).
 * Theory of Operation:
 *   Recursive descent with one member function per grammar rule. Binary and
 *   unary operators use an explicit operator/operand stack (precedence table
 *   in ParseExpr.cpp) so operator chains never recurse; bracket nesting,
 *   nested expressions and blocks are bounded by a depth counter checked on
 *   every re-entry.
 *   Parse functions never throw: on failure they record a ParseError and
 *   return null (or false). Statement loops then resynchronize at the next
 *   NEWLINE outside brackets, skipping an indented block that belongs to a
 *   broken header, and continue so several independent errors are reported.
 *     module    := { statement } END
 *     statement := compound | simple { ';' simple } [';'] NEWLINE
 *     block     := NEWLINE INDENT { statement } DEDENT | simple-statements
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "parser/ParseError.h"
#include "parser/ParseResult.h"
#include "parser/ParserOptions.h"
#include "parser/Precedence.h"

namespace pyrite::obs {
class Metrics;
} // namespace pyrite::obs

namespace pyrite::parse {

class Parser {
 public:
  explicit Parser(lex::ITokenStream& stream, ParserOptions options = {})
      : ts_(stream), opts_(options) {}

  ParseResult parseModule();

  // A single expression followed by END (used for f-string replacement fields).
  ExprResult parseExpressionInput();

 private:
  using ExprPtr = ast::ExprPtr;
  using StmtPtr = ast::StmtPtr;
  using PatternPtr = ast::PatternPtr;

  lex::ITokenStream& ts_;
  ParserOptions opts_;

  bool initialized_{false};
  std::vector<lex::Token> tokens_{};
  size_t pos_{0};
  std::vector<ParseError> lexErrors_{};
  std::vector<ParseError> errors_{};
  int depth_{0};
  bool depthReported_{false};
  std::vector<size_t> openBrackets_{}; // token indices of unclosed ( [ {

  // RAII nesting counter; see checkDepth()
  struct DepthScope {
    int& d;
    explicit DepthScope(int& ref) : d(ref) { ++d; }
    ~DepthScope() { --d; }
    DepthScope(const DepthScope&) = delete;
    DepthScope& operator=(const DepthScope&) = delete;
    DepthScope(DepthScope&&) = delete;
    DepthScope& operator=(DepthScope&&) = delete;
  };

  // Remembers an opening bracket for "was never closed" diagnostics
  struct BracketScope {
    std::vector<size_t>& open;
    BracketScope(std::vector<size_t>& stack, size_t index) : open(stack) { open.push_back(index); }
    ~BracketScope() { open.pop_back(); }
    BracketScope(const BracketScope&) = delete;
    BracketScope& operator=(const BracketScope&) = delete;
    BracketScope(BracketScope&&) = delete;
    BracketScope& operator=(BracketScope&&) = delete;
  };

  // token access (Parser.cpp)
  void initBuffer();
  const lex::Token& peek(size_t k = 0) const;
  const lex::Token& get();
  const lex::Token& previous() const;
  bool at(lex::TokenKind kind) const { return peek().kind == kind; }
  bool match(lex::TokenKind kind);
  bool expect(lex::TokenKind kind, const char* what);
  bool atSoftKeyword(const char* word, size_t k = 0) const;
  bool atLayoutEnd() const; // only NEWLINE/DEDENT tokens remain before END

  // diagnostics
  void addError(ErrorKind kind, int line, int col, std::string message, std::string expected = {},
                std::string found = {});
  void errorAt(const lex::Token& tok, ErrorKind kind, std::string message);
  void errorAt(const ast::Span& span, ErrorKind kind, std::string message);
  void errorExpected(const char* what);
  bool checkDepth(const char* message);
  static std::string describe(const lex::Token& tok);

  // recovery
  void synchronize();
  void skipIndentedBlock();
  bool atLineBoundary() const;

  // spans
  static ast::Span spanOf(const lex::Token& tok);
  ast::Span spanFrom(const lex::Token& first) const;
  static ast::Span join(const ast::Span& a, const ast::Span& b);

  // blocks and statements (ParseStmt.cpp)
  bool parseBlock(ast::StmtList& out, const char* owner);
  void parseStatementsUntilDedent(ast::StmtList& out);
  bool parseStatement(ast::StmtList& out);
  bool parseSimpleStatements(ast::StmtList& out);
  StmtPtr parseSmallStatement();
  StmtPtr parseExprOrAssignStatement();
  StmtPtr parseReturnStmt();
  StmtPtr parseRaiseStmt();
  StmtPtr parseDelStmt();
  StmtPtr parseAssertStmt();
  StmtPtr parseNameListStmt(bool nonlocal);
  StmtPtr parseImportStmt();
  StmtPtr parseImportFromStmt();
  bool parseDottedName(std::string& out);
  bool parseImportAlias(ast::Alias& out, bool dotted);
  StmtPtr parseIfStmt();
  StmtPtr parseWhileStmt();
  StmtPtr parseForStmt(const lex::Token& start, bool isAsync);
  StmtPtr parseTryStmt();
  StmtPtr parseWithStmt(const lex::Token& start, bool isAsync);
  bool parseWithItem(std::vector<ast::WithItem>& items);
  StmtPtr parseDecorated();
  StmtPtr parseFunctionDef(const lex::Token& start, ast::ExprList decorators, bool isAsync);
  StmtPtr parseClassDef(const lex::Token& start, ast::ExprList decorators);
  bool parseParameters(ast::Arguments& out, lex::TokenKind closer, bool annotations);
  bool parseParam(ast::Param& out, bool annotations);

  // match/case (ParsePattern.cpp)
  bool atMatchStatement() const;
  StmtPtr parseMatchStmt();
  bool parseMatchCase(ast::MatchStmt& stmt);
  PatternPtr parseCasePatterns();
  PatternPtr parseAsPattern();
  PatternPtr parseOrPattern();
  PatternPtr parseClosedPattern();
  PatternPtr parseMaybeStarPattern();
  PatternPtr parseSequencePattern(const lex::Token& open, lex::TokenKind closer, ast::PatternList elements);
  PatternPtr parseMappingPattern(const lex::Token& open);
  PatternPtr parseClassPattern(ExprPtr cls, const lex::Token& start);
  ExprPtr parseLiteralValue();
  ExprPtr parseDottedValue();
  bool checkSequenceStars(const ast::PatternList& elements);

  // expressions (ParseExpr.cpp)
  ExprPtr parseStarExpressions(); // a, *b, c  (tuple without parentheses)
  ExprPtr parseStarOrNamed(); // display element
  ExprPtr parseNamedExpr();
  ExprPtr parseTest();
  ExprPtr parseLambda();
  ExprPtr parseBinary(int minPrec);
  ExprPtr parseOperand();
  ExprPtr parsePrimary();
  ExprPtr parseAtom();
  ExprPtr parseDisplay(const lex::Token& open);
  ExprPtr parseParenthesized(const lex::Token& open);
  ExprPtr parseBracketDisplay(const lex::Token& open);
  ExprPtr parseBraceDisplay(const lex::Token& open);
  bool parseDisplayElements(ast::ExprList& out, lex::TokenKind closer);
  bool parseComprehensionFors(std::vector<ast::ComprehensionFor>& out);
  bool parseCallArguments(ast::ExprList& args, std::vector<ast::Keyword>& keywords);
  ExprPtr parseSubscript();
  ExprPtr parseSliceItem();
  ExprPtr parseYieldExpr();
  ExprPtr parseTargetList(); // for-loop and comprehension targets
  static bool canStartExpression(lex::TokenKind kind);

  // target validation (ParseTarget.cpp)
  bool setTarget(ast::Expr& target, ast::ExprContext ctx);
  bool setTargetElements(ast::ExprList& elements, ast::ExprContext ctx);
  static const char* describeExpr(const ast::Expr& e);

  // string literals (ParseFString.cpp)
  ExprPtr parseStrings();
  bool appendFStringParts(const std::vector<lex::FStringPart>& parts, std::vector<ast::FStringSegment>& out);
  ExprPtr parseReplacementField(const lex::FStringPart& part);
  ExprPtr buildFormatSpec(const std::vector<lex::FStringPart>& parts, const ast::Span& span);

  ParseResult finish(std::unique_ptr<ast::Module> module);
};

// Lex and parse a buffer; timings and counters go to metrics when non-null.
ParseResult parseSource(const std::string& source, const std::string& file, const lex::LexerOptions& lexOptions = {},
                        const ParserOptions& options = {}, obs::Metrics* metrics = nullptr);

// As parseSource, but throws exceptions::SyntaxError listing every error.
std::unique_ptr<ast::Module> parseSourceOrThrow(const std::string& source, const std::string& file,
                                                const lex::LexerOptions& lexOptions = {},
                                                const ParserOptions& options = {});

} // namespace pyrite::parse

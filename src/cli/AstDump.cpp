/***
 * Name: pyrite::cli::RunAstDump
 * Purpose: Read, lex and parse one source file and print what was requested.
 */
#include "cli/AstDump.h"

#include <ostream>
#include <string>
#include "lexer/Lexer.h"
#include "observability/AstPrinter.h"
#include "observability/Metrics.h"
#include "parser/FormatError.h"
#include "parser/Parser.h"
#include "pyrite/exceptions/file_read_error.h"
#include "pyrite/support/fs.h"

namespace pyrite::cli {

namespace {

void printTokens(const std::string& source, const std::string& file, const lex::LexerOptions& options,
                 std::ostream& out) {
  const auto result = lex::tokenize(source, file, options);
  for (const auto& tok : result.tokens) {
    out << tok.line << ":" << tok.col << " " << lex::to_string(tok.kind);
    const bool layout = tok.kind == lex::TokenKind::Newline || tok.kind == lex::TokenKind::Indent ||
                        tok.kind == lex::TokenKind::Dedent || tok.kind == lex::TokenKind::End;
    if (!layout) out << " '" << tok.text << "'";
    out << "\n";
  }
}

} // namespace

int RunAstDump(const Options& opts, std::ostream& out, std::ostream& err) {
  const std::string& path = opts.inputs.front();
  std::string source;
  std::string readError;
  if (!support::ReadFile(path, source, readError)) throw exceptions::FileReadError(readError);

  lex::LexerOptions lexOptions;
  lexOptions.tabWidth = opts.tabWidth;
  parse::ParserOptions parseOptions;
  parseOptions.maxNestingDepth = opts.maxDepth;

  if (opts.dumpTokens) printTokens(source, path, lexOptions, out);

  const bool wantMetrics = opts.metrics || opts.metricsJson;
  obs::Metrics metrics;
  const auto result = parse::parseSource(source, path, lexOptions, parseOptions, wantMetrics ? &metrics : nullptr);

  if (!result.ok()) {
    err << parse::FormatErrors(result.errors, source, opts.tabWidth) << "\n";
    err << "pyrite-astdump: " << result.errors.size() << (result.errors.size() == 1 ? " error" : " errors")
        << " in " << path << "\n";
  } else if (!opts.noAst) {
    obs::AstPrinter printer;
    out << printer.print(*result.module);
  }

  if (wantMetrics) out << (opts.metricsJson ? metrics.summaryJson() : metrics.summaryText());
  return result.ok() ? 0 : 1;
}

} // namespace pyrite::cli

/***
 * Name: pyrite::parse::parseSource / parseSourceOrThrow
 * Purpose: One-call lexing and parsing of an in-memory buffer.
 * Inputs:
 *   - source text and a file name used in diagnostics
 *   - lexer and parser options
 *   - optional Metrics sink
 * Outputs: ParseResult (or a Module, for the throwing variant)
 * Theory of Operation: The lexer runs to completion first so its timing and
 *   token count are observable separately; the parser then consumes the
 *   buffered tokens. Geometry is recorded only when a tree was produced.
 */
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include "ast/GeometrySummary.h"
#include "lexer/Lexer.h"
#include "observability/Metrics.h"
#include "parser/FormatError.h"
#include "parser/Parser.h"
#include "pyrite/exceptions/syntax_error.h"

namespace pyrite::parse {

ParseResult parseSource(const std::string& source, const std::string& file, const lex::LexerOptions& lexOptions,
                        const ParserOptions& options, obs::Metrics* metrics) {
  lex::Lexer lexer(source, file, lexOptions);
  {
    obs::ScopedStage stage(metrics, "lex");
    const auto& tokens = lexer.tokens();
    if (metrics != nullptr) {
      metrics->setCounter("tokens", tokens.size());
      metrics->setGauge("source_bytes", source.size());
    }
  }

  ParseResult result;
  {
    obs::ScopedStage stage(metrics, "parse");
    Parser parser(lexer, options);
    result = parser.parseModule();
  }

  if (metrics != nullptr) {
    size_t lexical = 0;
    for (const auto& err : result.errors) {
      if (err.lexical) ++lexical;
    }
    metrics->setCounter("lex_errors", lexical);
    metrics->setCounter("parse_errors", result.errors.size() - lexical);
    if (result.module) {
      const auto geom = ast::ComputeGeometry(*result.module);
      metrics->setAstGeometry(obs::AstGeometry{geom.nodes, geom.maxDepth, geom.statements, geom.maxBlockDepth});
    }
  }
  return result;
}

std::unique_ptr<ast::Module> parseSourceOrThrow(const std::string& source, const std::string& file,
                                                const lex::LexerOptions& lexOptions, const ParserOptions& options) {
  ParseResult result = parseSource(source, file, lexOptions, options);
  if (!result.ok()) {
    throw exceptions::SyntaxError(FormatErrors(result.errors, source, lexOptions.tabWidth), result.errors.size());
  }
  return std::move(result.module);
}

} // namespace pyrite::parse

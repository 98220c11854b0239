/***
 * Name: pyrite::parse::ParseResult / ExprResult
 * Purpose: Outcome of a parse: a tree, or the accumulated errors.
 * Theory of Operation: A tree is only handed out when no error was recorded;
 *   any error (lexical or syntactic) leaves the tree pointer null.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Module.h"
#include "parser/ParseError.h"

namespace pyrite::parse {

struct ParseResult {
  std::unique_ptr<ast::Module> module{};
  std::vector<ParseError> errors{};

  bool ok() const { return errors.empty(); }
};

struct ExprResult {
  ast::ExprPtr expr{};
  std::vector<ParseError> errors{};

  bool ok() const { return errors.empty(); }
};

} // namespace pyrite::parse

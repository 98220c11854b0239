/***
 * Name: pyrite::obs::AstPrinter
 * Purpose: AST pretty-printer for diagnostics/logging and snapshot tests.
 * Inputs:
 *   - ast::Module (or a single expression)
 * Outputs:
 *   - Formatted string with node kinds and salient fields, one node per line.
 * Theory of Operation:
 *   Labels each node with std::visit and descends through ast::ForEachChild,
 *   indenting two spaces per tree level.
 */
#pragma once

#include <sstream>
#include <string>
#include "ast/Nodes.h"
#include "ast/Walk.h"

namespace pyrite::obs {

class AstPrinter {
 public:
  std::string print(const ast::Module& m);
  std::string print(const ast::Expr& e);

  // Single-line label of one node, without children
  static std::string label(ast::NodeRef node);

 private:
  void emit(ast::NodeRef node);
  std::ostringstream ss_{};
  int depth_{0};
};

} // namespace pyrite::obs

/**
 * @file
 * @brief AST geometry computation implementation.
 */
/***
 * Name: pyrite::ast::ComputeGeometry
 * Purpose: Traverse AST and compute node count, max depth, statement count and
 *   max block nesting.
 * Inputs:
 *   - module: parsed module
 * Outputs:
 *   - GeometrySummary
 * Theory of Operation: Depth-first traversal over ForEachChild with an explicit
 *   work stack, so very deep expression trees do not consume native stack.
 *   A statement nested directly under another statement opens one block level.
 */
#include "ast/GeometrySummary.h"

#include <algorithm>
#include <vector>
#include "ast/Walk.h"

namespace pyrite::ast {

namespace {
struct Frame {
  NodeRef node;
  uint64_t depth;
  uint64_t blockDepth; // block level of the nearest enclosing statement
};
} // namespace

GeometrySummary ComputeGeometry(const Module& module) {
  GeometrySummary out{};
  std::vector<Frame> work;
  work.push_back(Frame{NodeRef{&module}, 1, 0});
  while (!work.empty()) {
    const Frame frame = work.back();
    work.pop_back();
    ++out.nodes;
    out.maxDepth = std::max(out.maxDepth, frame.depth);
    const bool isStmt = std::holds_alternative<const Stmt*>(frame.node);
    if (isStmt) {
      ++out.statements;
      out.maxBlockDepth = std::max(out.maxBlockDepth, frame.blockDepth);
    }
    const bool opensBlock = isStmt || std::holds_alternative<const Module*>(frame.node);
    ForEachChild(frame.node, [&](NodeRef child) {
      uint64_t block = frame.blockDepth;
      if (std::holds_alternative<const Stmt*>(child) && opensBlock) ++block;
      work.push_back(Frame{child, frame.depth + 1, block});
    });
  }
  return out;
}

} // namespace pyrite::ast

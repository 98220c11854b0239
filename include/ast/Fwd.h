/**
 * @file
 * @brief Forward declarations and owning pointer aliases for AST categories.
 */
#pragma once

#include <memory>
#include <vector>

namespace pyrite::ast {

    struct Expr;
    struct Stmt;
    struct Pattern;

    using ExprPtr = std::unique_ptr<Expr>;
    using StmtPtr = std::unique_ptr<Stmt>;
    using PatternPtr = std::unique_ptr<Pattern>;

    using ExprList = std::vector<ExprPtr>;
    using StmtList = std::vector<StmtPtr>;

} // namespace pyrite::ast

/**
 * @file
 * @brief Generic child enumeration over the AST variants.
 */
#pragma once

#include <functional>
#include <variant>
#include "ast/Nodes.h"

namespace pyrite::ast {

    // Non-owning reference to any node category
    using NodeRef = std::variant<const Module*, const Stmt*, const Expr*, const Pattern*>;

    using ChildFn = std::function<void(NodeRef)>;

    // Calls fn for each direct child of node in source order. Helper records
    // (Keyword, Param, WithItem, ExceptHandler, MatchCase, comprehension clauses)
    // are flattened: their expressions, patterns and statements are reported
    // as children of the owning node.
    void ForEachChild(NodeRef node, const ChildFn& fn);

} // namespace pyrite::ast

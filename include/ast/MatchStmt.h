/**
 * @file
 * @brief AST match statement and its cases.
 */
#pragma once

#include <vector>
#include "ast/Fwd.h"
#include "ast/Pattern.h"
#include "ast/Span.h"

namespace pyrite::ast {

    struct MatchCase {
        PatternPtr pattern;
        ExprPtr guard{}; // optional; null when absent
        StmtList body;
        Span span{};
    };

    struct MatchStmt {
        ExprPtr subject;
        std::vector<MatchCase> cases;
    };

} // namespace pyrite::ast

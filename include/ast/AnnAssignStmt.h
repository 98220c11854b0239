/**
 * @file
 * @brief AST annotated assignment.
 */
#pragma once

#include "ast/Fwd.h"

namespace pyrite::ast {

    // target: annotation [= value]
    struct AnnAssignStmt {
        ExprPtr target;
        ExprPtr annotation;
        ExprPtr value{}; // optional
        bool simple{true}; // target is a plain unparenthesized name
    };

} // namespace pyrite::ast

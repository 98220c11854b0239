/**
 * @file
 * @brief AST assignment statement (possibly chained).
 */
#pragma once

#include "ast/Fwd.h"

namespace pyrite::ast {

    // a = b = value: targets=[a, b]
    struct AssignStmt {
        ExprList targets;
        ExprPtr value;
    };

} // namespace pyrite::ast

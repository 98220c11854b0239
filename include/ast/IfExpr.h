/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/Fwd.h"

namespace pyrite::ast {

    // body if test else orelse
    struct IfExpr {
        ExprPtr test;
        ExprPtr body;
        ExprPtr orelse;
    };

} // namespace pyrite::ast

/**
 * @file
 * @brief AST yield and yield-from declarations.
 */
#pragma once

#include "ast/Fwd.h"

namespace pyrite::ast {

    struct YieldExpr {
        ExprPtr value; // optional
    };

    struct YieldFromExpr {
        ExprPtr value;
    };

} // namespace pyrite::ast

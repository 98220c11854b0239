/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/Fwd.h"
#include "ast/Param.h"

namespace pyrite::ast {

    struct LambdaExpr {
        Arguments args;
        ExprPtr body;
    };

} // namespace pyrite::ast

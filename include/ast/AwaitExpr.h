/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/Fwd.h"

namespace pyrite::ast {

    struct AwaitExpr {
        ExprPtr value;
    };

} // namespace pyrite::ast

/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/Fwd.h"

namespace pyrite::ast {

    // target := value
    struct NamedExpr {
        ExprPtr target; // Name in Store context
        ExprPtr value;
    };

} // namespace pyrite::ast

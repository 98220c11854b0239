/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/Fwd.h"

namespace pyrite::ast {

    struct DictLiteral {
        ExprList keys; // null key marks a **mapping entry
        ExprList values;
    };

} // namespace pyrite::ast

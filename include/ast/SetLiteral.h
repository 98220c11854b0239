/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/Fwd.h"

namespace pyrite::ast {

    struct SetLiteral {
        ExprList elements;
    };

} // namespace pyrite::ast

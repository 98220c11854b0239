/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/ExprContext.h"
#include "ast/Fwd.h"

namespace pyrite::ast {

    struct TupleLiteral {
        ExprList elements;
        ExprContext ctx{ExprContext::Load};
    };

} // namespace pyrite::ast

/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/Fwd.h"
#include "ast/Span.h"

namespace pyrite::ast {

    struct WithItem {
        ExprPtr contextExpr;
        ExprPtr optionalVars{}; // "as" target, Store context
        Span span{};
    };

} // namespace pyrite::ast

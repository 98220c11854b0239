/**
 * @file
 * @brief AST subscription and slice declarations.
 */
#pragma once

#include "ast/ExprContext.h"
#include "ast/Fwd.h"

namespace pyrite::ast {

    struct Subscript {
        ExprPtr value;
        ExprPtr slice; // Slice, Tuple of indices, or a plain expression
        ExprContext ctx{ExprContext::Load};
    };

    // lower:upper:step, each part optional
    struct Slice {
        ExprPtr lower;
        ExprPtr upper;
        ExprPtr step;
    };

} // namespace pyrite::ast

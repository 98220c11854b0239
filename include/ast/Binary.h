/**
 * @file
 * @brief AST binary and N-ary boolean operations.
 */
#pragma once

#include "ast/BinaryOperator.h"
#include "ast/Fwd.h"

namespace pyrite::ast {

    struct Binary {
        ExprPtr left;
        BinaryOperator op{BinaryOperator::Add};
        ExprPtr right;
    };

    // a and b and c: one node, op is And or Or
    struct BoolOp {
        BinaryOperator op{BinaryOperator::And};
        ExprList values;
    };

} // namespace pyrite::ast

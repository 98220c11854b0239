/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/BinaryOperator.h"
#include "ast/Fwd.h"

namespace pyrite::ast {

    // target op= value
    struct AugAssignStmt {
        ExprPtr target;
        BinaryOperator op{BinaryOperator::Add};
        ExprPtr value;
    };

} // namespace pyrite::ast

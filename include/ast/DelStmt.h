/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/Fwd.h"

namespace pyrite::ast {

    struct DelStmt {
        ExprList targets; // Del context
    };

} // namespace pyrite::ast

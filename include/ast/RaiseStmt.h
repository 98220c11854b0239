/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/Fwd.h"

namespace pyrite::ast {

    struct RaiseStmt {
        ExprPtr exc{}; // optional
        ExprPtr cause{}; // from ...
    };

} // namespace pyrite::ast

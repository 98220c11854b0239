/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/Fwd.h"

namespace pyrite::ast {

    struct WhileStmt {
        ExprPtr test;
        StmtList body;
        StmtList orelse;
    };

} // namespace pyrite::ast

/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/Fwd.h"

namespace pyrite::ast {

    struct ForStmt {
        ExprPtr target;
        ExprPtr iter;
        StmtList body;
        StmtList orelse;
        bool isAsync{false};
    };

} // namespace pyrite::ast

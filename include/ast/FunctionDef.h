/**
 * @file
 * @brief AST function definition (def and async def).
 */
#pragma once

#include <string>
#include "ast/Fwd.h"
#include "ast/Param.h"

namespace pyrite::ast {

    struct FunctionDef {
        std::string name;
        Arguments args;
        StmtList body;
        ExprList decorators; // in source order
        ExprPtr returns{}; // optional return annotation
        bool isAsync{false};
    };

} // namespace pyrite::ast

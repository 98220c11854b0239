/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <string>
#include "ast/ExprContext.h"

namespace pyrite::ast {

    struct Name {
        std::string id;
        ExprContext ctx{ExprContext::Load};
    };

} // namespace pyrite::ast

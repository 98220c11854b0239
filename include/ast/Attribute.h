/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <string>
#include "ast/ExprContext.h"
#include "ast/Fwd.h"

namespace pyrite::ast {

    struct Attribute {
        ExprPtr value;
        std::string attr;
        ExprContext ctx{ExprContext::Load};
    };

} // namespace pyrite::ast

/**
 * @file
 * @brief AST import alias.
 */
#pragma once

#include <string>
#include "ast/Span.h"

namespace pyrite::ast {

    // name [as asName]; name may be dotted or "*"
    struct Alias {
        std::string name;
        std::string asName{};
        Span span{};
    };

} // namespace pyrite::ast

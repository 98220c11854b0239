/**
 * @file
 * @brief AST f-string declarations.
 */
#pragma once

#include <string>
#include <variant>
#include <vector>
#include "ast/Fwd.h"

namespace pyrite::ast {

    // {value!conversion:formatSpec}
    struct FormattedValue {
        ExprPtr value;
        char conversion{0}; // 'r', 's', 'a' or 0
        ExprPtr formatSpec{}; // FStringLiteral, optional
    };

    // literal text or a formatted value, in source order
    using FStringSegment = std::variant<std::string, FormattedValue>;

    struct FStringLiteral {
        std::vector<FStringSegment> segments;
    };

} // namespace pyrite::ast

/**
 * @file
 * @brief Function and lambda parameter declarations.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "ast/Fwd.h"
#include "ast/Span.h"

namespace pyrite::ast {

    struct Param {
        std::string name;
        ExprPtr annotation{}; // optional
        ExprPtr defaultValue{}; // optional
        Span span{};
    };

    // def f(a, /, b, *args, c, **kwargs)
    struct Arguments {
        std::vector<Param> posOnly; // before '/'
        std::vector<Param> args;
        std::optional<Param> varArg; // *args
        std::vector<Param> kwOnly; // after '*' or *args
        std::optional<Param> kwArg; // **kwargs
    };

} // namespace pyrite::ast

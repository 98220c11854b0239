/**
 * @file
 * @brief AST geometry summary declarations.
 */
#pragma once

#include <cstdint>
#include "ast/Module.h"

namespace pyrite::ast {
    // Size and shape of a module tree
    struct GeometrySummary {
        uint64_t nodes{0}; // module, statements, expressions and patterns
        uint64_t maxDepth{0}; // module alone is depth 1
        uint64_t statements{0};
        uint64_t maxBlockDepth{0}; // top-level statements are at block depth 1
    };

    GeometrySummary ComputeGeometry(const Module& module);

} // namespace pyrite::ast

/**
 * @file
 * @brief Source span carried by every AST node.
 */
#pragma once

namespace pyrite::ast {

    // 1-based positions; endCol is exclusive.
    struct Span {
        int line{0};
        int col{0};
        int endLine{0};
        int endCol{0};
    };

} // namespace pyrite::ast

/**
 * @file
 * @brief Expression context (load/store/delete) for names and targets.
 */
#pragma once

namespace pyrite::ast {

    enum class ExprContext { Load, Store, Del };

    const char* to_string(ExprContext ctx);

} // namespace pyrite::ast

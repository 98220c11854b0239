/**
 * @file
 * @brief AST declarations.
 */
#pragma once


namespace pyrite::ast {

    struct BreakStmt {};

} // namespace pyrite::ast

/**
 * @file
 * @brief AST expression node: a closed variant over every expression form.
 */
#pragma once

#include <memory>
#include <utility>
#include <variant>
#include "ast/Attribute.h"
#include "ast/AwaitExpr.h"
#include "ast/Binary.h"
#include "ast/Call.h"
#include "ast/Compare.h"
#include "ast/Comprehension.h"
#include "ast/Constant.h"
#include "ast/DictLiteral.h"
#include "ast/FStringLiteral.h"
#include "ast/IfExpr.h"
#include "ast/LambdaExpr.h"
#include "ast/ListLiteral.h"
#include "ast/Name.h"
#include "ast/NamedExpr.h"
#include "ast/SetLiteral.h"
#include "ast/Span.h"
#include "ast/Starred.h"
#include "ast/Subscript.h"
#include "ast/TupleLiteral.h"
#include "ast/Unary.h"
#include "ast/YieldExpr.h"

namespace pyrite::ast {

    struct Expr {
        using Kind = std::variant<Name, Constant, Binary, BoolOp, Unary, Compare, Call, Attribute, Subscript, Slice,
                                  ListLiteral, TupleLiteral, SetLiteral, DictLiteral, Comprehension, LambdaExpr,
                                  IfExpr, FStringLiteral, Starred, NamedExpr, AwaitExpr, YieldExpr, YieldFromExpr>;
        Kind node;
        Span span{};

        template <typename T> bool is() const { return std::holds_alternative<T>(node); }
        template <typename T> T& as() { return std::get<T>(node); }
        template <typename T> const T& as() const { return std::get<T>(node); }
        template <typename T> T* getIf() { return std::get_if<T>(&node); }
        template <typename T> const T* getIf() const { return std::get_if<T>(&node); }
    };

    template <typename T>
    ExprPtr makeExpr(T node, const Span& span) {
        return std::make_unique<Expr>(Expr{Expr::Kind{std::in_place_type<T>, std::move(node)}, span});
    }

    // Stable node kind name, e.g. "Name", "Compare"
    const char* kindName(const Expr& e);

} // namespace pyrite::ast

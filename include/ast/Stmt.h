/**
 * @file
 * @brief AST statement node: a closed variant over every statement form.
 */
#pragma once

#include <memory>
#include <utility>
#include <variant>
#include "ast/AnnAssignStmt.h"
#include "ast/AssertStmt.h"
#include "ast/AssignStmt.h"
#include "ast/AugAssignStmt.h"
#include "ast/BreakStmt.h"
#include "ast/ClassDef.h"
#include "ast/ContinueStmt.h"
#include "ast/DelStmt.h"
#include "ast/Expr.h"
#include "ast/ExprStmt.h"
#include "ast/ForStmt.h"
#include "ast/FunctionDef.h"
#include "ast/GlobalStmt.h"
#include "ast/IfStmt.h"
#include "ast/Import.h"
#include "ast/ImportFrom.h"
#include "ast/MatchStmt.h"
#include "ast/NonlocalStmt.h"
#include "ast/PassStmt.h"
#include "ast/RaiseStmt.h"
#include "ast/ReturnStmt.h"
#include "ast/Span.h"
#include "ast/TryStmt.h"
#include "ast/WhileStmt.h"
#include "ast/WithStmt.h"

namespace pyrite::ast {

    struct Stmt {
        using Kind = std::variant<FunctionDef, ClassDef, ReturnStmt, DelStmt, AssignStmt, AugAssignStmt,
                                  AnnAssignStmt, ForStmt, WhileStmt, IfStmt, WithStmt, RaiseStmt, TryStmt,
                                  AssertStmt, Import, ImportFrom, GlobalStmt, NonlocalStmt, ExprStmt, PassStmt,
                                  BreakStmt, ContinueStmt, MatchStmt>;
        Kind node;
        Span span{};

        template <typename T> bool is() const { return std::holds_alternative<T>(node); }
        template <typename T> T& as() { return std::get<T>(node); }
        template <typename T> const T& as() const { return std::get<T>(node); }
        template <typename T> T* getIf() { return std::get_if<T>(&node); }
        template <typename T> const T* getIf() const { return std::get_if<T>(&node); }
    };

    template <typename T>
    StmtPtr makeStmt(T node, const Span& span) {
        return std::make_unique<Stmt>(Stmt{Stmt::Kind{std::in_place_type<T>, std::move(node)}, span});
    }

    const char* kindName(const Stmt& s);

} // namespace pyrite::ast

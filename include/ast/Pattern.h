/**
 * @file
 * @brief AST structural pattern declarations for match/case.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "ast/Expr.h"
#include "ast/Fwd.h"
#include "ast/Span.h"

namespace pyrite::ast {

    using PatternList = std::vector<PatternPtr>;

    // _
    struct PatternWildcard {};

    // capture: binds the subject to name
    struct PatternName {
        std::string name;
    };

    // literal, negative/complex number or dotted name (a.b)
    struct PatternValue {
        ExprPtr value;
    };

    struct PatternSequence {
        bool isList{true}; // true: [...], false: (...) or bare
        PatternList elements; // at most one PatternStar
    };

    // *name or *_ inside a sequence pattern
    struct PatternStar {
        std::optional<std::string> name; // empty for *_
    };

    struct PatternMapping {
        ExprList keys;
        PatternList patterns; // same length as keys
        std::optional<std::string> rest; // **rest
    };

    // Cls(p1, p2, kw=p3)
    struct PatternClass {
        ExprPtr cls; // Name or Attribute chain
        PatternList args;
        std::vector<std::string> kwdNames;
        PatternList kwdPatterns;
    };

    struct PatternOr {
        PatternList patterns; // two or more alternatives
    };

    // pattern as name
    struct PatternAs {
        PatternPtr pattern;
        std::string name;
    };

    struct Pattern {
        using Kind = std::variant<PatternWildcard, PatternName, PatternValue, PatternSequence, PatternStar,
                                  PatternMapping, PatternClass, PatternOr, PatternAs>;
        Kind node;
        Span span{};

        template <typename T> bool is() const { return std::holds_alternative<T>(node); }
        template <typename T> T& as() { return std::get<T>(node); }
        template <typename T> const T& as() const { return std::get<T>(node); }
        template <typename T> const T* getIf() const { return std::get_if<T>(&node); }
    };

    template <typename T>
    PatternPtr makePattern(T node, const Span& span) {
        return std::make_unique<Pattern>(Pattern{Pattern::Kind{std::in_place_type<T>, std::move(node)}, span});
    }

    const char* kindName(const Pattern& p);

} // namespace pyrite::ast

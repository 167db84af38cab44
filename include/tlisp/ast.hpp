// Expression tree produced by the parser and consumed by the checker and evaluator.
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "tlisp/types.hpp"

namespace tlisp
{

    struct Expr;
    using ExprPtr = std::shared_ptr<const Expr>;

    struct SourcePos
    {
        int line = -1;
        int col = -1;
    };

    struct Symbol
    {
        std::string name;
    };
    // Only the empty list `()` survives parsing; other lists become forms or calls.
    struct List
    {
        std::vector<ExprPtr> elems;
    };
    struct If
    {
        ExprPtr condition;
        ExprPtr then_branch;
        ExprPtr else_branch;
    };
    // body == nullptr is the sequential form that binds into the current scope.
    struct Let
    {
        std::string name;
        std::optional<Type> annotation;
        ExprPtr value;
        ExprPtr body;
    };
    struct Param
    {
        std::string name;
        Type type;
    };
    struct Defn
    {
        std::string name;
        std::vector<Param> params;
        Type ret;
        ExprPtr body;
    };
    struct Lambda
    {
        std::vector<Param> params;
        std::optional<Type> ret;
        ExprPtr body;
    };
    struct Call
    {
        ExprPtr callee;
        std::vector<ExprPtr> args;
    };

    using ExprData = std::variant<int32_t, int64_t, double, bool, std::string, Symbol, List, If, Let, Defn, Lambda, Call>;

    struct Expr
    {
        ExprData data;
        SourcePos pos;
    };

    template <typename T>
    ExprPtr make_expr(T value, SourcePos pos = {})
    {
        return std::make_shared<const Expr>(Expr{ExprData(std::move(value)), pos});
    }

    inline ExprPtr make_symbol(std::string name, SourcePos pos = {}) { return make_expr(Symbol{std::move(name)}, pos); }
    inline ExprPtr make_call(ExprPtr callee, std::vector<ExprPtr> args, SourcePos pos = {})
    {
        return make_expr(Call{std::move(callee), std::move(args)}, pos);
    }

    // Canonical source text; parsing it yields an equal tree (positions aside).
    std::string to_string(const Expr &e);
    inline std::string to_string(const ExprPtr &e) { return e ? to_string(*e) : std::string("<null>"); }

    // Literal text for a float that parses back to the same value and always carries a '.'.
    std::string format_float(double v);
    std::string quote_string(const std::string &s);

    // Structural equality ignoring source positions.
    bool equal(const Expr &a, const Expr &b);

} // namespace tlisp

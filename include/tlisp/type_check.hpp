// Structural static checker: no unification, `_` accepts anything.
#pragma once
#include "tlisp/ast.hpp"
#include "tlisp/diagnostics.hpp"
#include "tlisp/env.hpp"
#include "tlisp/options.hpp"
#include "tlisp/types.hpp"
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace tlisp {

struct TypeCheckResult {
    bool success=true;
    Type type;
    std::vector<Diagnostic> errors;
    std::vector<Diagnostic> warnings;
    // First error message, empty on success.
    std::string message() const { return errors.empty() ? std::string() : errors.front().message; }
};

class TypeChecker {
public:
    TypeChecker() = default;
    explicit TypeChecker(Options opts): opts_(opts){}

    // Checks `e` against `env`. Sequential lets and defns bind into `env` itself.
    TypeCheckResult check(const Expr& e, const TypeEnvPtr& env);

private:
    Options opts_{};

    std::optional<Type> check_expr(TypeCheckResult& r, const Expr& e, const TypeEnvPtr& env);
    std::optional<Type> check_symbol(TypeCheckResult& r, const Expr& e, const Symbol& s, const TypeEnvPtr& env);
    std::optional<Type> check_if(TypeCheckResult& r, const Expr& e, const If& f, const TypeEnvPtr& env);
    std::optional<Type> check_let(TypeCheckResult& r, const Expr& e, const Let& l, const TypeEnvPtr& env);
    std::optional<Type> check_defn(TypeCheckResult& r, const Expr& e, const Defn& d, const TypeEnvPtr& env);
    std::optional<Type> check_lambda(TypeCheckResult& r, const Expr& e, const Lambda& l, const TypeEnvPtr& env);
    std::optional<Type> check_call(TypeCheckResult& r, const Expr& e, const Expr& callee, const std::vector<ExprPtr>& args, const TypeEnvPtr& env);

    void error_code(TypeCheckResult& r, const Expr& n, std::string code, std::string msg, std::string hint="");
    // Attaches expected/found notes to the error.
    void type_mismatch(TypeCheckResult& r, const Expr& n, const std::string& code, std::string msg,
                       const std::string& role, const Type& expected, const Type& actual);

    // "did you mean" support for undefined names
    static int edit_distance(const std::string& a, const std::string& b);
    static std::vector<std::string> fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist);
    void append_suggestions(Diagnostic& err, const std::vector<std::string>& suggs);

    // W0700 / W0701
    static void collect_uses(const Expr& e, std::unordered_set<std::string>& used);
    void lint_unused(TypeCheckResult& r, const Expr& at, const std::string& code, const std::string& what,
                     const std::vector<std::string>& names, const Expr& body);
};

} // namespace tlisp

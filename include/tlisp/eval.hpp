// Tree-walking evaluator over the value environment chain.
#pragma once
#include "tlisp/ast.hpp"
#include "tlisp/diagnostics.hpp"
#include "tlisp/options.hpp"
#include "tlisp/value.hpp"
#include <string>
#include <vector>

namespace tlisp {

struct EvalResult {
    bool success=false;
    Value value;
    std::string error;      // message, empty on success
    Diagnostic diagnostic;  // filled on failure
};

class Evaluator {
public:
    Evaluator() = default;
    explicit Evaluator(Options opts): opts_(opts){}

    EvalResult eval(const Expr& e, const ValueEnvPtr& env);

    // Throwing form used internally and by callers that manage their own recovery.
    Value eval_expr(const Expr& e, const ValueEnvPtr& env);

    // Applies a callable to already evaluated arguments.
    Value apply(const Value& callee, const std::vector<Value>& args, const Expr& site);

private:
    Options opts_{};
    unsigned depth_ = 0;

    Value eval_if(const Expr& e, const If& f, const ValueEnvPtr& env);
    Value eval_let(const Let& l, const ValueEnvPtr& env);
    Value eval_call(const Expr& e, const Expr& callee, const std::vector<ExprPtr>& args, const ValueEnvPtr& env);
};

} // namespace tlisp

#include <gtest/gtest.h>
#include <sstream>
#include "tlisp/builtins.hpp"
#include "tlisp/eval.hpp"
#include "tlisp/parser.hpp"

using namespace tlisp;

namespace {

class EvalTest : public ::testing::Test {
protected:
    std::ostringstream out;
    ValueEnvPtr env = ValueEnv::make_root();
    Options opts;

    void SetUp() override { install_builtins(*env, out); }

    EvalResult run(const std::string& src){ return Evaluator(opts).eval(*parse(src), env); }

    Value value_of(const std::string& src){
        auto r = run(src);
        EXPECT_TRUE(r.success) << src << ": " << r.error;
        return r.value;
    }

    Diagnostic failure(const std::string& src){
        auto r = run(src);
        EXPECT_FALSE(r.success) << src;
        return r.diagnostic;
    }
};

} // namespace

TEST_F(EvalTest, LiteralsEvaluateToThemselves){
    EXPECT_EQ(value_of("7"), Value(int32_t(7)));
    EXPECT_EQ(value_of("2147483648"), Value(int64_t(2147483648LL)));
    EXPECT_EQ(value_of("2.5"), Value(2.5));
    EXPECT_EQ(value_of("false"), Value(false));
    EXPECT_EQ(value_of("\"txt\""), Value("txt"));
}

TEST_F(EvalTest, IfTakesOnlyOneBranch){
    EXPECT_EQ(value_of("(if (< 1 2) (print \"yes\") (print \"no\"))"), Value("yes"));
    EXPECT_EQ(out.str(), "yes");
}

TEST_F(EvalTest, LetScoping){
    EXPECT_EQ(value_of("(let x 1 (let x 2 x))"), Value(int32_t(2)));
    EXPECT_EQ(value_of("(let x 1)"), Value(int32_t(1)));
    EXPECT_EQ(value_of("(let y 10 (+ x y))"), Value(int32_t(11)));
    EXPECT_EQ(value_of("x"), Value(int32_t(1)));
    EXPECT_EQ(failure("y").code, "R0100");
}

TEST_F(EvalTest, ClosuresCaptureTheirScope){
    value_of("(let make-adder (fn [n: i32] (fn [m: i32] (+ n m))))");
    value_of("(let add10 (make-adder 10))");
    EXPECT_EQ(value_of("(add10 5)"), Value(int32_t(15)));
    EXPECT_EQ(value_of("((make-adder 1) 1)"), Value(int32_t(2)));
    // the parameter n is not visible at top level
    EXPECT_EQ(failure("n").code, "R0100");
}

TEST_F(EvalTest, ClosuresCaptureTheirScopeByValue){
    value_of("(let base 1)");
    value_of("(defn get-base [] -> i32 base)");
    value_of("(let base 2)");
    EXPECT_EQ(value_of("(get-base)"), Value(int32_t(1)));
    value_of("(let offset 10)");
    value_of("(let add-offset (fn [v: i32] (+ v offset)))");
    value_of("(let offset \"changed\")");
    EXPECT_EQ(value_of("(add-offset 5)"), Value(int32_t(15)));
}

TEST_F(EvalTest, ClosureScopeDoesNotHoldTheClosure){
    auto fn = value_of("(defn self-ref [n: i32] -> i32 n)");
    const auto& c = fn.as<std::shared_ptr<const Closure>>();
    EXPECT_EQ(c->env->lookup("self-ref"), nullptr);
    EXPECT_EQ(c->env->parent(), nullptr);
    EXPECT_NE(c->env, env);
}

TEST_F(EvalTest, RecursiveDefn){
    auto fact = value_of("(defn fact [n: i32] -> i32 (if (= n 0) 1 (* n (fact (- n 1)))))");
    EXPECT_EQ(to_string(fact), "#<function:1>");
    EXPECT_EQ(value_of("(fact 5)"), Value(int32_t(120)));
    value_of("(defn fib [n: i32] -> i32 (if (< n 2) n (+ (fib (- n 1)) (fib (- n 2)))))");
    EXPECT_EQ(value_of("(fib 10)"), Value(int32_t(55)));
}

TEST_F(EvalTest, RecursionThroughAnAlias){
    value_of("(defn fact [n: i32] -> i32 (if (= n 0) 1 (* n (fact (- n 1)))))");
    value_of("(let g fact)");
    EXPECT_EQ(value_of("(g 6)"), Value(int32_t(720)));
    // rebinding the original name does not break the alias
    value_of("(let fact 0)");
    EXPECT_EQ(value_of("(g 5)"), Value(int32_t(120)));
}

TEST_F(EvalTest, ArgumentsEvaluateLeftToRight){
    EXPECT_EQ(value_of("(+ (print 1) (print 2))"), Value(int32_t(3)));
    EXPECT_EQ(out.str(), "12");
}

TEST_F(EvalTest, RuntimeErrors){
    auto undefined = failure("zz");
    EXPECT_EQ(undefined.code, "R0100");
    EXPECT_EQ(undefined.message, "Undefined variable: zz");
    EXPECT_EQ(undefined.stage, Stage::Eval);

    auto cond = failure("(if 1 2 3)");
    EXPECT_EQ(cond.code, "R0200");
    EXPECT_EQ(cond.message, "If condition must be a boolean");
    EXPECT_EQ(cond.col, 5);

    auto arity = failure("((fn [x: i32] x) 1 2)");
    EXPECT_EQ(arity.code, "R0300");
    EXPECT_EQ(arity.message, "Wrong number of arguments: expected 1, got 2");

    auto builtin_arity = failure("(+ 1)");
    EXPECT_EQ(builtin_arity.code, "R0300");
    EXPECT_EQ(builtin_arity.message, "Wrong number of arguments for +: expected 2, got 1");

    auto not_callable = failure("(5 1)");
    EXPECT_EQ(not_callable.code, "R0301");
    EXPECT_EQ(not_callable.message, "Cannot call non-function value: 5");

    auto empty = failure("()");
    EXPECT_EQ(empty.code, "R0600");
    EXPECT_EQ(empty.message, "Empty list");
}

TEST_F(EvalTest, BuiltinErrorsReportTheCallSite){
    auto d = failure("(+ 1\n  (/ 4 0))");
    EXPECT_EQ(d.code, "R0400");
    EXPECT_EQ(d.message, "Division by zero");
    EXPECT_EQ(d.line, 2);
    EXPECT_EQ(d.col, 3);
    EXPECT_FALSE(d.hint.empty());
}

TEST_F(EvalTest, CallDepthIsBounded){
    opts.max_call_depth = 50;
    value_of("(defn spin [n: i32] -> i32 (spin n))");
    auto d = failure("(spin 1)");
    EXPECT_EQ(d.code, "R0500");
    EXPECT_EQ(d.message, "Maximum call depth exceeded (50)");

    value_of("(defn count-down [n: i32] -> i32 (if (= n 0) 0 (count-down (- n 1))))");
    EXPECT_EQ(value_of("(count-down 40)"), Value(int32_t(0)));
}

TEST_F(EvalTest, ThrowingEntryPoint){
    Evaluator ev(opts);
    EXPECT_THROW(ev.eval_expr(*parse("(/ 1 0)"), env), eval_error);
    try {
        ev.eval_expr(*parse("missing"), env);
        FAIL() << "expected eval_error";
    } catch(const eval_error& e){
        EXPECT_EQ(e.code, "R0100");
        EXPECT_EQ(e.line, 1);
        EXPECT_EQ(e.col, 1);
    }
}

TEST_F(EvalTest, ApplyCallsValuesDirectly){
    Evaluator ev(opts);
    auto site = parse("(f)");
    auto plus = *env->lookup("+");
    EXPECT_EQ(ev.apply(plus, {Value(int32_t(2)), Value(int32_t(3))}, *site), Value(int32_t(5)));
    auto square = ev.eval_expr(*parse("(fn [x: i32] (* x x))"), env);
    EXPECT_EQ(ev.apply(square, {Value(int32_t(9))}, *site), Value(int32_t(81)));
    EXPECT_THROW(ev.apply(Value(true), {}, *site), eval_error);
}

TEST_F(EvalTest, PrintedLiteralsEvaluateBackToTheSameValue){
    std::vector<ExprPtr> literals = {
        make_expr(int32_t(-7)), make_expr(int32_t(INT32_MAX)),
        make_expr(int64_t(INT64_MIN)), make_expr(int64_t(4294967296LL)),
        make_expr(0.1), make_expr(-2.5), make_expr(1e20), make_expr(1.5e-7), make_expr(3.0),
        make_expr(true), make_expr(std::string("tab\tquote\"")),
    };
    for(const auto& lit : literals){
        auto text = to_string(lit);
        auto back = value_of(text);
        EXPECT_EQ(back, Evaluator(opts).eval_expr(*lit, env)) << text;
    }
}

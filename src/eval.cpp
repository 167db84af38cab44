#include "tlisp/eval.hpp"
#include <cstdio>

namespace tlisp {

namespace {

const char* hint_for(const std::string& code){
    if(code=="R0100") return "the name is not bound in any enclosing scope";
    if(code=="R0200") return "conditions must evaluate to true or false";
    if(code=="R0300") return "pass exactly as many arguments as the function declares";
    if(code=="R0301") return "only closures and built-ins can be called";
    if(code=="R0400") return "check the divisor before dividing";
    if(code=="R0401") return "operands must share one numeric width";
    if(code=="R0500") return "raise TLISP_MAX_DEPTH or bound the recursion";
    if(code=="R0600") return "an application needs at least a callee";
    return "";
}

struct DepthGuard {
    unsigned& depth;
    explicit DepthGuard(unsigned& d): depth(d){ ++depth; }
    ~DepthGuard(){ --depth; }
};

} // namespace

EvalResult Evaluator::eval(const Expr& e, const ValueEnvPtr& env){
    EvalResult r;
    try {
        r.value = eval_expr(e, env);
        r.success = true;
    } catch(const eval_error& ex){
        r.success = false;
        r.error = ex.what();
        r.diagnostic = ErrorReporter::make(Stage::Eval, ex.code, ex.what(), hint_for(ex.code), ex.line, ex.col);
    }
    return r;
}

Value Evaluator::eval_expr(const Expr& e, const ValueEnvPtr& env){
    struct V {
        Evaluator& ev; const Expr& e; const ValueEnvPtr& env;
        Value operator()(int32_t v) const { return v; }
        Value operator()(int64_t v) const { return v; }
        Value operator()(double v) const { return v; }
        Value operator()(bool v) const { return v; }
        Value operator()(const std::string& s) const { return s; }
        Value operator()(const Symbol& s) const {
            if(const Value* v = env->lookup(s.name)) return *v;
            throw eval_error("R0100", "Undefined variable: "+s.name, e.pos.line, e.pos.col);
        }
        Value operator()(const List& l) const {
            if(l.elems.empty()) throw eval_error("R0600", "Empty list", e.pos.line, e.pos.col);
            std::vector<ExprPtr> args(l.elems.begin()+1, l.elems.end());
            return ev.eval_call(e, *l.elems.front(), args, env);
        }
        Value operator()(const If& f) const { return ev.eval_if(e, f, env); }
        Value operator()(const Let& l) const { return ev.eval_let(l, env); }
        Value operator()(const Defn& d) const {
            auto c = std::make_shared<Closure>();
            c->name = d.name;
            for(auto& p : d.params) c->params.push_back(p.name);
            c->body = d.body;
            c->env = env->snapshot(); // the name itself is bound per call, see apply()
            Value fn(std::shared_ptr<const Closure>(std::move(c)));
            env->define(d.name, fn);
            return fn;
        }
        Value operator()(const Lambda& l) const {
            auto c = std::make_shared<Closure>();
            for(auto& p : l.params) c->params.push_back(p.name);
            c->body = l.body;
            c->env = env->snapshot();
            return Value(std::shared_ptr<const Closure>(std::move(c)));
        }
        Value operator()(const Call& c) const { return ev.eval_call(e, *c.callee, c.args, env); }
    };
    return std::visit(V{*this, e, env}, e.data);
}

Value Evaluator::eval_if(const Expr& e, const If& f, const ValueEnvPtr& env){
    Value cond = eval_expr(*f.condition, env);
    if(!cond.is<bool>()){
        const Expr& at = f.condition ? *f.condition : e;
        throw eval_error("R0200", "If condition must be a boolean", at.pos.line, at.pos.col);
    }
    return eval_expr(cond.as<bool>() ? *f.then_branch : *f.else_branch, env);
}

Value Evaluator::eval_let(const Let& l, const ValueEnvPtr& env){
    Value v = eval_expr(*l.value, env);
    if(!l.body){
        env->define(l.name, v);
        return v;
    }
    auto child = env->extend();
    child->define(l.name, std::move(v));
    return eval_expr(*l.body, child);
}

Value Evaluator::eval_call(const Expr& e, const Expr& callee, const std::vector<ExprPtr>& args, const ValueEnvPtr& env){
    Value fn = eval_expr(callee, env);
    std::vector<Value> values;
    values.reserve(args.size());
    for(auto& a : args) values.push_back(eval_expr(*a, env));
    return apply(fn, values, e);
}

Value Evaluator::apply(const Value& callee, const std::vector<Value>& args, const Expr& site){
    if(callee.is<std::shared_ptr<const Closure>>()){
        const auto& c = callee.as<std::shared_ptr<const Closure>>();
        if(args.size() != c->params.size())
            throw eval_error("R0300", "Wrong number of arguments: expected "+std::to_string(c->params.size())+", got "+std::to_string(args.size()),
                             site.pos.line, site.pos.col);
        if(depth_ >= opts_.max_call_depth)
            throw eval_error("R0500", "Maximum call depth exceeded ("+std::to_string(opts_.max_call_depth)+")", site.pos.line, site.pos.col);
        DepthGuard guard(depth_);
        if(opts_.debug_eval)
            std::fprintf(stderr, "[dbg][eval] call %s argc=%zu depth=%u\n", c->name.empty() ? "<lambda>" : c->name.c_str(), args.size(), depth_);
        auto frame = c->env->extend();
        // a defn sees itself under its own name, however it was reached
        if(!c->name.empty()) frame->define(c->name, callee);
        for(size_t i=0;i<args.size();++i) frame->define(c->params[i], args[i]);
        return eval_expr(*c->body, frame);
    }
    if(callee.is<std::shared_ptr<const Builtin>>()){
        const auto& b = callee.as<std::shared_ptr<const Builtin>>();
        if(args.size() != b->arity)
            throw eval_error("R0300", "Wrong number of arguments for "+b->name+": expected "+std::to_string(b->arity)+", got "+std::to_string(args.size()),
                             site.pos.line, site.pos.col);
        if(opts_.debug_eval)
            std::fprintf(stderr, "[dbg][eval] builtin %s argc=%zu\n", b->name.c_str(), args.size());
        try {
            return b->fn(args);
        } catch(const eval_error& ex){
            if(ex.line >= 0) throw;
            throw eval_error(ex.code, ex.what(), site.pos.line, site.pos.col);
        }
    }
    throw eval_error("R0301", "Cannot call non-function value: "+to_string(callee), site.pos.line, site.pos.col);
}

} // namespace tlisp

#include "tlisp/type_check.hpp"
#include <algorithm>

namespace tlisp {

TypeCheckResult TypeChecker::check(const Expr& e, const TypeEnvPtr& env){
    TypeCheckResult r;
    auto t = check_expr(r, e, env);
    r.success = r.errors.empty() && t.has_value();
    if(r.success) r.type = *t;
    return r;
}

void TypeChecker::error_code(TypeCheckResult& r, const Expr& n, std::string code, std::string msg, std::string hint){
    ErrorReporter rep{&r.errors,&r.warnings};
    rep.emit_error(ErrorReporter::make(Stage::Check, std::move(code), std::move(msg), std::move(hint), n.pos.line, n.pos.col));
    r.success=false;
}

void TypeChecker::type_mismatch(TypeCheckResult& r, const Expr& n, const std::string& code, std::string msg,
                                const std::string& role, const Type& expected, const Type& actual){
    ErrorReporter rep{&r.errors,&r.warnings};
    std::string expStr = to_string(expected);
    std::string actStr = to_string(actual);
    auto err = ErrorReporter::make(Stage::Check, code, std::move(msg), "ensure "+role+" has type "+expStr, n.pos.line, n.pos.col);
    err.notes.push_back(DiagnosticNote{"expected: "+expStr, n.pos.line, n.pos.col});
    err.notes.push_back(DiagnosticNote{"   found: "+actStr, n.pos.line, n.pos.col});
    rep.emit_error(err);
    r.success=false;
}

std::optional<Type> TypeChecker::check_expr(TypeCheckResult& r, const Expr& e, const TypeEnvPtr& env){
    struct V {
        TypeChecker& tc; TypeCheckResult& r; const Expr& e; const TypeEnvPtr& env;
        std::optional<Type> operator()(int32_t) const { return i32_type(); }
        std::optional<Type> operator()(int64_t) const { return i64_type(); }
        std::optional<Type> operator()(double) const { return f64_type(); }
        std::optional<Type> operator()(bool) const { return bool_type(); }
        std::optional<Type> operator()(const std::string&) const { return string_type(); }
        std::optional<Type> operator()(const Symbol& s) const { return tc.check_symbol(r, e, s, env); }
        std::optional<Type> operator()(const List& l) const {
            if(l.elems.empty()){ tc.error_code(r, e, "E0600", "Empty list", "an application needs at least a callee"); return std::nullopt; }
            std::vector<ExprPtr> args(l.elems.begin()+1, l.elems.end());
            return tc.check_call(r, e, *l.elems.front(), args, env);
        }
        std::optional<Type> operator()(const If& f) const { return tc.check_if(r, e, f, env); }
        std::optional<Type> operator()(const Let& l) const { return tc.check_let(r, e, l, env); }
        std::optional<Type> operator()(const Defn& d) const { return tc.check_defn(r, e, d, env); }
        std::optional<Type> operator()(const Lambda& l) const { return tc.check_lambda(r, e, l, env); }
        std::optional<Type> operator()(const Call& c) const { return tc.check_call(r, e, *c.callee, c.args, env); }
    };
    return std::visit(V{*this, r, e, env}, e.data);
}

std::optional<Type> TypeChecker::check_symbol(TypeCheckResult& r, const Expr& e, const Symbol& s, const TypeEnvPtr& env){
    if(const Type* t = env->lookup(s.name)) return *t;
    ErrorReporter rep{&r.errors,&r.warnings};
    auto err = ErrorReporter::make(Stage::Check, "E0100", "Undefined variable: "+s.name, "bind it with let or defn before use", e.pos.line, e.pos.col);
    append_suggestions(err, fuzzy_candidates(s.name, env->visible_names(), 2));
    rep.emit_error(err);
    r.success=false;
    return std::nullopt;
}

std::optional<Type> TypeChecker::check_if(TypeCheckResult& r, const Expr& e, const If& f, const TypeEnvPtr& env){
    auto cond = check_expr(r, *f.condition, env);
    if(!cond) return std::nullopt;
    if(!cond->is_base(BaseType::Bool)){
        type_mismatch(r, *f.condition, "E0200", "If condition must be bool, got "+to_string(*cond), "if condition", bool_type(), *cond);
        return std::nullopt;
    }
    auto then_t = check_expr(r, *f.then_branch, env);
    if(!then_t) return std::nullopt;
    auto else_t = check_expr(r, *f.else_branch, env);
    if(!else_t) return std::nullopt;
    if(*then_t != *else_t){
        type_mismatch(r, e, "E0201", "If branches must have same type: "+to_string(*then_t)+" vs "+to_string(*else_t),
                      "else branch", *then_t, *else_t);
        return std::nullopt;
    }
    return then_t;
}

std::optional<Type> TypeChecker::check_let(TypeCheckResult& r, const Expr& e, const Let& l, const TypeEnvPtr& env){
    auto value_t = check_expr(r, *l.value, env);
    if(!value_t) return std::nullopt;
    Type bound = *value_t;
    if(l.annotation && !l.annotation->is_inferred()){
        if(*l.annotation != *value_t){
            type_mismatch(r, e, "E0300", "Type mismatch: expected "+to_string(*l.annotation)+", got "+to_string(*value_t),
                          "let binding '"+l.name+"'", *l.annotation, *value_t);
            return std::nullopt;
        }
        bound = *l.annotation;
    }
    if(!l.body){
        env->define(l.name, bound);
        return bound;
    }
    auto child = env->extend();
    child->define(l.name, bound);
    auto body_t = check_expr(r, *l.body, child);
    if(!body_t) return std::nullopt;
    lint_unused(r, e, "W0701", "binding", {l.name}, *l.body);
    return body_t;
}

std::optional<Type> TypeChecker::check_defn(TypeCheckResult& r, const Expr& e, const Defn& d, const TypeEnvPtr& env){
    std::vector<Type> param_types;
    std::vector<std::string> names;
    for(auto& p : d.params){ param_types.push_back(p.type); names.push_back(p.name); }
    Type fn_type = Type::function(param_types, d.ret);

    // the name is visible to its own body so recursive calls check
    auto child = env->extend();
    child->define(d.name, fn_type);
    for(auto& p : d.params) child->define(p.name, p.type);
    auto body_t = check_expr(r, *d.body, child);
    if(!body_t) return std::nullopt;
    if(!d.ret.is_inferred() && *body_t != d.ret){
        type_mismatch(r, e, "E0400", "Return type mismatch: expected "+to_string(d.ret)+", got "+to_string(*body_t),
                      "body of '"+d.name+"'", d.ret, *body_t);
        return std::nullopt;
    }
    env->define(d.name, fn_type);
    lint_unused(r, e, "W0700", "parameter", names, *d.body);
    return fn_type;
}

std::optional<Type> TypeChecker::check_lambda(TypeCheckResult& r, const Expr& e, const Lambda& l, const TypeEnvPtr& env){
    std::vector<Type> param_types;
    std::vector<std::string> names;
    auto child = env->extend();
    for(auto& p : l.params){ param_types.push_back(p.type); names.push_back(p.name); child->define(p.name, p.type); }
    auto body_t = check_expr(r, *l.body, child);
    if(!body_t) return std::nullopt;
    if(l.ret && !l.ret->is_inferred() && *body_t != *l.ret){
        type_mismatch(r, e, "E0401", "Lambda return type mismatch: expected "+to_string(*l.ret)+", got "+to_string(*body_t),
                      "lambda body", *l.ret, *body_t);
        return std::nullopt;
    }
    lint_unused(r, e, "W0700", "parameter", names, *l.body);
    return Type::function(std::move(param_types), *body_t);
}

std::optional<Type> TypeChecker::check_call(TypeCheckResult& r, const Expr& e, const Expr& callee, const std::vector<ExprPtr>& args, const TypeEnvPtr& env){
    auto callee_t = check_expr(r, callee, env);
    if(!callee_t) return std::nullopt;
    if(!callee_t->is_function()){
        error_code(r, callee, "E0500", "Cannot call non-function type: "+to_string(*callee_t), "only functions can appear in call position");
        return std::nullopt;
    }
    const auto& params = callee_t->params;
    if(params.size() != args.size()){
        error_code(r, e, "E0501", "Wrong number of arguments: expected "+std::to_string(params.size())+", got "+std::to_string(args.size()),
                   "callee type is "+to_string(*callee_t));
        return std::nullopt;
    }
    std::optional<Type> last;
    for(size_t i=0;i<args.size();++i){
        auto arg_t = check_expr(r, *args[i], env);
        if(!arg_t) return std::nullopt;
        if(!params[i].is_inferred() && *arg_t != params[i]){
            type_mismatch(r, *args[i], "E0502", "Type mismatch in argument "+std::to_string(i+1)+": expected "+to_string(params[i])+", got "+to_string(*arg_t),
                          "argument "+std::to_string(i+1), params[i], *arg_t);
            return std::nullopt;
        }
        last = arg_t;
    }
    const Type& ret = callee_t->return_type();
    // `_` return: the call takes the type of its last argument
    if(ret.is_inferred() && last) return last;
    return ret;
}

// --- suggestion utilities ---
int TypeChecker::edit_distance(const std::string& a, const std::string& b){
    size_t n=a.size(), m=b.size();
    if(n>64||m>64){ // cap to avoid large allocs; simple fallback
        int dist=0; for(size_t i=0;i<std::min(n,m);++i) if(a[i]!=b[i]) ++dist; dist += (int)std::max(n,m)- (int)std::min(n,m); return dist; }
    int dp[65][65];
    for(size_t i=0;i<=n;++i) dp[i][0]=(int)i;
    for(size_t j=0;j<=m;++j) dp[0][j]=(int)j;
    for(size_t i=1;i<=n;++i){ for(size_t j=1;j<=m;++j){ int c = a[i-1]==b[j-1]?0:1; dp[i][j]=std::min({dp[i-1][j]+1, dp[i][j-1]+1, dp[i-1][j-1]+c}); } }
    return dp[n][m];
}

std::vector<std::string> TypeChecker::fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist){
    std::vector<std::pair<int,std::string>> scored;
    for(auto &c: pool){ if(c.empty() || c==target) continue; int d=edit_distance(target,c); if(d<=maxDist) scored.emplace_back(d,c); }
    std::stable_sort(scored.begin(), scored.end(), [](const auto& x, const auto& y){ return x.first < y.first; });
    std::vector<std::string> out;
    for(auto& s : scored){ if(out.size()==5) break; out.push_back(s.second); }
    return out;
}

void TypeChecker::append_suggestions(Diagnostic& err, const std::vector<std::string>& suggs){
    if(suggs.empty() || !opts_.suggest) return;
    std::string msg="did you mean ";
    for(size_t i=0;i<suggs.size();++i){ msg+=suggs[i]; if(i+1<suggs.size()) msg+= i+2==suggs.size()?" or ":", "; }
    err.notes.push_back(DiagnosticNote{msg,err.line,err.col});
}

// --- lints ---
void TypeChecker::collect_uses(const Expr& e, std::unordered_set<std::string>& used){
    struct V {
        std::unordered_set<std::string>& used;
        void walk(const ExprPtr& p) const { if(p) collect_uses(*p, used); }
        void operator()(const Symbol& s) const { used.insert(s.name); }
        void operator()(const List& l) const { for(auto& x : l.elems) walk(x); }
        void operator()(const If& f) const { walk(f.condition); walk(f.then_branch); walk(f.else_branch); }
        void operator()(const Let& l) const { walk(l.value); walk(l.body); }
        void operator()(const Defn& d) const { walk(d.body); }
        void operator()(const Lambda& l) const { walk(l.body); }
        void operator()(const Call& c) const { walk(c.callee); for(auto& a : c.args) walk(a); }
        void operator()(int32_t) const {}
        void operator()(int64_t) const {}
        void operator()(double) const {}
        void operator()(bool) const {}
        void operator()(const std::string&) const {}
    };
    std::visit(V{used}, e.data);
}

void TypeChecker::lint_unused(TypeCheckResult& r, const Expr& at, const std::string& code, const std::string& what,
                              const std::vector<std::string>& names, const Expr& body){
    if(!opts_.lint || names.empty()) return;
    std::unordered_set<std::string> used;
    collect_uses(body, used);
    ErrorReporter rep{&r.errors,&r.warnings};
    for(auto& n : names){
        if(n.empty() || n[0]=='_' || used.count(n)) continue;
        rep.emit_warning(ErrorReporter::make(Stage::Check, code, "unused "+what+" '"+n+"'", "prefix with _ to silence", at.pos.line, at.pos.col));
    }
}

} // namespace tlisp

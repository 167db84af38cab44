#include "tlisp/builtins.hpp"
#include <ostream>
#include <type_traits>

namespace tlisp {

namespace {

// Two's complement wrap-around for the integer operators.
template<typename I> I wrap_add(I a, I b){ using U = std::make_unsigned_t<I>; return static_cast<I>(static_cast<U>(a) + static_cast<U>(b)); }
template<typename I> I wrap_sub(I a, I b){ using U = std::make_unsigned_t<I>; return static_cast<I>(static_cast<U>(a) - static_cast<U>(b)); }
template<typename I> I wrap_mul(I a, I b){ using U = std::make_unsigned_t<I>; return static_cast<I>(static_cast<U>(a) * static_cast<U>(b)); }
template<typename I> I checked_div(I a, I b){
    if(b == 0) throw eval_error("R0400", "Division by zero");
    if(b == -1) return wrap_sub(I(0), a); // MIN / -1 wraps to MIN
    return a / b;
}

template<typename Op>
Builtin::Fn int_op(const std::string& name, Op op){
    std::string msg = name + " requires two integers of the same type";
    return [msg, op](const std::vector<Value>& a) -> Value {
        if(a[0].is<int32_t>() && a[1].is<int32_t>()) return op(a[0].as<int32_t>(), a[1].as<int32_t>());
        if(a[0].is<int64_t>() && a[1].is<int64_t>()) return op(a[0].as<int64_t>(), a[1].as<int64_t>());
        throw eval_error("R0401", msg);
    };
}

template<typename Op>
Builtin::Fn float_op(const std::string& name, Op op){
    std::string msg = name + " requires two floats";
    return [msg, op](const std::vector<Value>& a) -> Value {
        if(a[0].is<double>() && a[1].is<double>()) return op(a[0].as<double>(), a[1].as<double>());
        throw eval_error("R0401", msg);
    };
}

template<typename Op>
Builtin::Fn bool_op(const std::string& name, Op op){
    std::string msg = name + " requires two booleans";
    return [msg, op](const std::vector<Value>& a) -> Value {
        if(a[0].is<bool>() && a[1].is<bool>()) return op(a[0].as<bool>(), a[1].as<bool>());
        throw eval_error("R0401", msg);
    };
}

void bind_builtin(ValueEnv& env, const std::string& name, size_t arity, Builtin::Fn fn){
    env.define(name, Value(std::make_shared<const Builtin>(Builtin{name, arity, std::move(fn)})));
}

} // namespace

void install_builtin_types(TypeEnv& env){
    const Type any = Type::inferred();
    const Type f64 = f64_type();
    const Type b = bool_type();
    for(const char* op : {"+", "-", "*", "/"}) env.define(op, Type::function({any, any}, any));
    for(const char* op : {"+.", "-.", "*.", "/."}) env.define(op, Type::function({f64, f64}, f64));
    for(const char* op : {"=", "<", ">", "<=", ">="}) env.define(op, Type::function({any, any}, b));
    for(const char* op : {"and", "or"}) env.define(op, Type::function({b, b}, b));
    env.define("not", Type::function({b}, b));
    env.define("print", Type::function({any}, any));
    env.define("println", Type::function({any}, any));
    env.define("type-of", Type::function({any}, string_type()));
}

void install_builtins(ValueEnv& env, std::ostream& out){
    bind_builtin(env, "+", 2, int_op("+", [](auto x, auto y){ return wrap_add(x, y); }));
    bind_builtin(env, "-", 2, int_op("-", [](auto x, auto y){ return wrap_sub(x, y); }));
    bind_builtin(env, "*", 2, int_op("*", [](auto x, auto y){ return wrap_mul(x, y); }));
    bind_builtin(env, "/", 2, int_op("/", [](auto x, auto y){ return checked_div(x, y); }));

    bind_builtin(env, "+.", 2, float_op("+.", [](double x, double y){ return x + y; }));
    bind_builtin(env, "-.", 2, float_op("-.", [](double x, double y){ return x - y; }));
    bind_builtin(env, "*.", 2, float_op("*.", [](double x, double y){ return x * y; }));
    bind_builtin(env, "/.", 2, float_op("/.", [](double x, double y){
        if(y == 0.0) throw eval_error("R0400", "Division by zero");
        return x / y;
    }));

    bind_builtin(env, "=", 2, int_op("=", [](auto x, auto y){ return x == y; }));
    bind_builtin(env, "<", 2, int_op("<", [](auto x, auto y){ return x < y; }));
    bind_builtin(env, ">", 2, int_op(">", [](auto x, auto y){ return x > y; }));
    bind_builtin(env, "<=", 2, int_op("<=", [](auto x, auto y){ return x <= y; }));
    bind_builtin(env, ">=", 2, int_op(">=", [](auto x, auto y){ return x >= y; }));

    bind_builtin(env, "and", 2, bool_op("and", [](bool x, bool y){ return x && y; }));
    bind_builtin(env, "or", 2, bool_op("or", [](bool x, bool y){ return x || y; }));
    bind_builtin(env, "not", 1, [](const std::vector<Value>& a) -> Value {
        if(!a[0].is<bool>()) throw eval_error("R0401", "not requires a boolean");
        return !a[0].as<bool>();
    });

    std::ostream* os = &out;
    bind_builtin(env, "print", 1, [os](const std::vector<Value>& a) -> Value {
        *os << to_string(a[0]);
        return a[0];
    });
    bind_builtin(env, "println", 1, [os](const std::vector<Value>& a) -> Value {
        *os << to_string(a[0]) << '\n';
        return a[0];
    });
    bind_builtin(env, "type-of", 1, [](const std::vector<Value>& a) -> Value {
        return std::string(a[0].type_name());
    });
}

} // namespace tlisp

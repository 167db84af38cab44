// Runtime values and the runtime environment.
#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include "tlisp/ast.hpp"
#include "tlisp/env.hpp"

namespace tlisp {

struct Value;
struct Closure;
struct Builtin;

using ValueData = std::variant<int32_t, int64_t, double, bool, std::string,
                               std::shared_ptr<const Closure>, std::shared_ptr<const Builtin>>;

struct Value {
    ValueData data;

    Value() = default;
    Value(int32_t v): data(v){}
    Value(int64_t v): data(v){}
    Value(double v): data(v){}
    Value(bool v): data(v){}
    Value(std::string v): data(std::move(v)){}
    Value(const char* v): data(std::string(v)){}
    Value(std::shared_ptr<const Closure> c): data(std::move(c)){}
    Value(std::shared_ptr<const Builtin> b): data(std::move(b)){}

    template<typename T> bool is() const { return std::holds_alternative<T>(data); }
    template<typename T> const T& as() const { return std::get<T>(data); }

    bool is_callable() const { return is<std::shared_ptr<const Closure>>() || is<std::shared_ptr<const Builtin>>(); }
    // "i32", "i64", "f64", "bool", "String", "function" or "builtin"
    const char* type_name() const;
};

using ValueEnv = Environment<Value>;
using ValueEnvPtr = std::shared_ptr<ValueEnv>;

// Runtime failure raised inside the evaluator and the built-ins.
struct eval_error : std::runtime_error {
    eval_error(std::string code, const std::string& message, int line=-1, int col=-1)
        : std::runtime_error(message), code(std::move(code)), line(line), col(col){}
    std::string code;
    int line;
    int col;
};

// A closure shares its body with the tree and owns a snapshot of the scope it
// was created in; rebinding a name afterwards does not change what it sees.
struct Closure {
    std::string name; // empty for anonymous functions
    std::vector<std::string> params;
    ExprPtr body;
    ValueEnvPtr env;  // detached copy, never the live defining scope
};

struct Builtin {
    using Fn = std::function<Value(const std::vector<Value>&)>;
    std::string name;
    size_t arity = 0;
    Fn fn;
};

// Display form: strings raw, closures #<function:N>, built-ins #<builtin:name:N>.
std::string to_string(const Value& v);

// Scalars compare by value, callables by identity.
bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b){ return !(a == b); }

} // namespace tlisp

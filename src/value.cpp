#include "tlisp/value.hpp"

namespace tlisp {

const char* Value::type_name() const {
    struct V {
        const char* operator()(int32_t) const { return "i32"; }
        const char* operator()(int64_t) const { return "i64"; }
        const char* operator()(double) const { return "f64"; }
        const char* operator()(bool) const { return "bool"; }
        const char* operator()(const std::string&) const { return "String"; }
        const char* operator()(const std::shared_ptr<const Closure>&) const { return "function"; }
        const char* operator()(const std::shared_ptr<const Builtin>&) const { return "builtin"; }
    };
    return std::visit(V{}, data);
}

std::string to_string(const Value& v){
    struct V {
        std::string operator()(int32_t i) const { return std::to_string(i); }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const { return format_float(d); }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(const std::string& s) const { return s; }
        std::string operator()(const std::shared_ptr<const Closure>& c) const {
            return "#<function:" + std::to_string(c->params.size()) + ">";
        }
        std::string operator()(const std::shared_ptr<const Builtin>& b) const {
            return "#<builtin:" + b->name + ":" + std::to_string(b->arity) + ">";
        }
    };
    return std::visit(V{}, v.data);
}

bool operator==(const Value& a, const Value& b){
    if(a.data.index() != b.data.index()) return false;
    return std::visit([&](const auto& x) -> bool {
        using T = std::decay_t<decltype(x)>;
        return std::get<T>(b.data) == x;
    }, a.data);
}

} // namespace tlisp

// Canonical printer + structural equality for expression trees.
#include "tlisp/ast.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace tlisp {

std::string format_float(double v){
    char buf[512];
    if(!std::isfinite(v)){
        std::snprintf(buf, sizeof(buf), "%g", v);
        return buf;
    }
    for(int prec=1; prec<=17; ++prec){
        std::snprintf(buf, sizeof(buf), "%.*g", prec, v);
        if(std::strtod(buf, nullptr) == v) break;
    }
    std::string s = buf;
    if(s.find_first_of("eE") != std::string::npos){
        // the grammar has no exponent syntax: shortest fixed notation that reads back exactly
        for(int prec=1; prec<=340; ++prec){
            std::snprintf(buf, sizeof(buf), "%.*f", prec, v);
            if(std::strtod(buf, nullptr) == v) break;
        }
        s = buf;
    }
    if(s.find('.') == std::string::npos) s += ".0";
    return s;
}

std::string quote_string(const std::string& s){
    std::string out = "\"";
    for(char c : s){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default: out += c; break;
        }
    }
    out += '"';
    return out;
}

static std::string params_to_string(const std::vector<Param>& params){
    std::string out = "[";
    for(size_t i=0;i<params.size();++i){
        if(i) out += ' ';
        out += params[i].name + ": " + to_string(params[i].type);
    }
    out += ']';
    return out;
}

std::string to_string(const Expr& e){
    struct V {
        std::string operator()(int32_t i) const { return std::to_string(i); }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const { return format_float(d); }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(const std::string& s) const { return quote_string(s); }
        std::string operator()(const Symbol& s) const { return s.name; }
        std::string operator()(const List& l) const {
            std::string out = "(";
            for(size_t i=0;i<l.elems.size();++i){ if(i) out += ' '; out += to_string(l.elems[i]); }
            return out + ')';
        }
        std::string operator()(const If& f) const {
            return "(if " + to_string(f.condition) + ' ' + to_string(f.then_branch) + ' ' + to_string(f.else_branch) + ')';
        }
        std::string operator()(const Let& l) const {
            std::string out = "(let " + l.name;
            if(l.annotation) out += ": " + to_string(*l.annotation);
            out += ' ' + to_string(l.value);
            if(l.body) out += ' ' + to_string(l.body);
            return out + ')';
        }
        std::string operator()(const Defn& d) const {
            return "(defn " + d.name + ' ' + params_to_string(d.params) + " -> " + to_string(d.ret) + ' ' + to_string(d.body) + ')';
        }
        std::string operator()(const Lambda& l) const {
            std::string out = "(fn " + params_to_string(l.params);
            if(l.ret) out += " -> " + to_string(*l.ret);
            return out + ' ' + to_string(l.body) + ')';
        }
        std::string operator()(const Call& c) const {
            std::string out = "(" + to_string(c.callee);
            for(auto& a : c.args) out += ' ' + to_string(a);
            return out + ')';
        }
    };
    return std::visit(V{}, e.data);
}

static bool equal_ptr(const ExprPtr& a, const ExprPtr& b){
    if(a.get() == b.get()) return true;
    if(!a || !b) return false;
    return equal(*a, *b);
}

static bool equal_params(const std::vector<Param>& a, const std::vector<Param>& b){
    if(a.size() != b.size()) return false;
    for(size_t i=0;i<a.size();++i) if(a[i].name != b[i].name || a[i].type != b[i].type) return false;
    return true;
}

static bool equal_all(const std::vector<ExprPtr>& a, const std::vector<ExprPtr>& b){
    if(a.size() != b.size()) return false;
    for(size_t i=0;i<a.size();++i) if(!equal_ptr(a[i], b[i])) return false;
    return true;
}

bool equal(const Expr& a, const Expr& b){
    if(a.data.index() != b.data.index()) return false;
    struct Visitor {
        const Expr& b;
        bool operator()(int32_t v) const { return std::get<int32_t>(b.data) == v; }
        bool operator()(int64_t v) const { return std::get<int64_t>(b.data) == v; }
        bool operator()(double v) const { return std::get<double>(b.data) == v; }
        bool operator()(bool v) const { return std::get<bool>(b.data) == v; }
        bool operator()(const std::string& v) const { return std::get<std::string>(b.data) == v; }
        bool operator()(const Symbol& v) const { return std::get<Symbol>(b.data).name == v.name; }
        bool operator()(const List& v) const { return equal_all(v.elems, std::get<List>(b.data).elems); }
        bool operator()(const If& v) const {
            const auto& o = std::get<If>(b.data);
            return equal_ptr(v.condition, o.condition) && equal_ptr(v.then_branch, o.then_branch) && equal_ptr(v.else_branch, o.else_branch);
        }
        bool operator()(const Let& v) const {
            const auto& o = std::get<Let>(b.data);
            if(v.name != o.name || v.annotation.has_value() != o.annotation.has_value()) return false;
            if(v.annotation && *v.annotation != *o.annotation) return false;
            return equal_ptr(v.value, o.value) && equal_ptr(v.body, o.body);
        }
        bool operator()(const Defn& v) const {
            const auto& o = std::get<Defn>(b.data);
            return v.name == o.name && equal_params(v.params, o.params) && v.ret == o.ret && equal_ptr(v.body, o.body);
        }
        bool operator()(const Lambda& v) const {
            const auto& o = std::get<Lambda>(b.data);
            if(!equal_params(v.params, o.params) || v.ret.has_value() != o.ret.has_value()) return false;
            if(v.ret && *v.ret != *o.ret) return false;
            return equal_ptr(v.body, o.body);
        }
        bool operator()(const Call& v) const {
            const auto& o = std::get<Call>(b.data);
            return equal_ptr(v.callee, o.callee) && equal_all(v.args, o.args);
        }
    };
    return std::visit(Visitor{b}, a.data);
}

} // namespace tlisp

#pragma once
#include "grammar.hpp"
#include "tlisp/parser.hpp"
#include <tao/pegtl.hpp>
#include <string>
#include <string_view>
#include <type_traits>

namespace tlisp::pegtl_front {

// Error kind and message for a rule that failed under must<>.
template<typename Rule>
struct error_info {
    static constexpr ParseErrorKind kind = ParseErrorKind::GenericParseFailure;
    static constexpr const char* message = nullptr; // nullptr: describe the offending token
};

template<> struct error_info< grammar::number_end > {
    static constexpr ParseErrorKind kind = ParseErrorKind::InvalidNumber;
    static constexpr const char* message = nullptr;
};
template<> struct error_info< grammar::escape_code > {
    static constexpr ParseErrorKind kind = ParseErrorKind::InvalidString;
    static constexpr const char* message = "unknown escape sequence";
};
template<> struct error_info< grammar::string_content > {
    static constexpr ParseErrorKind kind = ParseErrorKind::InvalidString;
    static constexpr const char* message = "malformed string literal";
};
template<> struct error_info< grammar::string_close > {
    static constexpr ParseErrorKind kind = ParseErrorKind::InvalidString;
    static constexpr const char* message = "unterminated string literal";
};
template<> struct error_info< grammar::fn_type_param > {
    static constexpr ParseErrorKind kind = ParseErrorKind::InvalidType;
    static constexpr const char* message = nullptr;
};
template<> struct error_info< grammar::fn_type_params > {
    static constexpr ParseErrorKind kind = ParseErrorKind::InvalidType;
    static constexpr const char* message = nullptr;
};
template<> struct error_info< grammar::fn_type_close > {
    static constexpr ParseErrorKind kind = ParseErrorKind::InvalidType;
    static constexpr const char* message = nullptr;
};
template<> struct error_info< grammar::fn_type_arrow > {
    static constexpr ParseErrorKind kind = ParseErrorKind::InvalidType;
    static constexpr const char* message = "function type needs '->' and a return type";
};
template<> struct error_info< grammar::fn_type_ret > {
    static constexpr ParseErrorKind kind = ParseErrorKind::InvalidType;
    static constexpr const char* message = nullptr;
};
template<> struct error_info< grammar::param_type > {
    static constexpr ParseErrorKind kind = ParseErrorKind::InvalidType;
    static constexpr const char* message = nullptr;
};
template<> struct error_info< grammar::ret_type > {
    static constexpr ParseErrorKind kind = ParseErrorKind::InvalidType;
    static constexpr const char* message = nullptr;
};
template<> struct error_info< grammar::param_colon > {
    static constexpr ParseErrorKind kind = ParseErrorKind::UnexpectedInput;
    static constexpr const char* message = "expected ':' between parameter name and type";
};
template<> struct error_info< grammar::params_close > {
    static constexpr ParseErrorKind kind = ParseErrorKind::UnexpectedInput;
    static constexpr const char* message = "expected parameter 'name: Type' or ']'";
};
template<> struct error_info< grammar::params > {
    static constexpr ParseErrorKind kind = ParseErrorKind::UnexpectedInput;
    static constexpr const char* message = "expected parameter list [name: Type ...]";
};
template<> struct error_info< grammar::if_operand > {
    static constexpr ParseErrorKind kind = ParseErrorKind::UnexpectedInput;
    static constexpr const char* message = "if requires exactly 3 arguments (condition, then, else)";
};
template<> struct error_info< grammar::if_close > {
    static constexpr ParseErrorKind kind = ParseErrorKind::UnexpectedInput;
    static constexpr const char* message = "if requires exactly 3 arguments (condition, then, else)";
};
template<> struct error_info< grammar::let_name > {
    static constexpr ParseErrorKind kind = ParseErrorKind::UnexpectedInput;
    static constexpr const char* message = "let requires a binding name";
};
template<> struct error_info< grammar::let_value > {
    static constexpr ParseErrorKind kind = ParseErrorKind::UnexpectedInput;
    static constexpr const char* message = "let requires a value";
};
template<> struct error_info< grammar::let_close > {
    static constexpr ParseErrorKind kind = ParseErrorKind::UnexpectedInput;
    static constexpr const char* message = "let accepts at most one body expression";
};
template<> struct error_info< grammar::defn_name > {
    static constexpr ParseErrorKind kind = ParseErrorKind::UnexpectedInput;
    static constexpr const char* message = "defn requires a function name";
};
template<> struct error_info< grammar::ret_arrow > {
    static constexpr ParseErrorKind kind = ParseErrorKind::UnexpectedInput;
    static constexpr const char* message = "defn requires '-> Type' after its parameters";
};
template<> struct error_info< grammar::fn_body > {
    static constexpr ParseErrorKind kind = ParseErrorKind::UnexpectedInput;
    static constexpr const char* message = "function requires a body expression";
};
template<> struct error_info< grammar::fn_close > {
    static constexpr ParseErrorKind kind = ParseErrorKind::UnexpectedInput;
    static constexpr const char* message = "function accepts exactly one body expression";
};
template<> struct error_info< grammar::list_close > {
    static constexpr ParseErrorKind kind = ParseErrorKind::UnexpectedInput;
    static constexpr const char* message = "expected ')' to close the list";
};
template<> struct error_info< grammar::top_expr > {
    static constexpr ParseErrorKind kind = ParseErrorKind::GenericParseFailure;
    static constexpr const char* message = nullptr;
};
template<> struct error_info< grammar::eof > {
    static constexpr ParseErrorKind kind = ParseErrorKind::UnexpectedInput;
    static constexpr const char* message = nullptr;
};


inline std::string_view remaining(const char* cur, const char* end){
    return std::string_view(cur, static_cast<size_t>(end - cur));
}

// The token at the failure point: a run of symbol characters, else one character.
inline std::string upcoming_token(std::string_view rest){
    auto is_sym = [](char c){
        return (c>='a'&&c<='z') || (c>='A'&&c<='Z') || (c>='0'&&c<='9') || std::string_view("+-*/<>=!&|_?.").find(c) != std::string_view::npos;
    };
    size_t n = 0;
    while(n < rest.size() && is_sym(rest[n])) ++n;
    if(n == 0 && !rest.empty()) n = 1;
    return std::string(rest.substr(0, n));
}

template<typename Rule>
struct control : tao::pegtl::normal<Rule> {
    template<typename Input, typename... States>
    [[noreturn]] static void raise(const Input& in, States&&...){
        using info = error_info<Rule>;
        const auto p = in.position();
        ParseError e;
        e.line = static_cast<int>(p.line);
        e.column = static_cast<int>(p.column);
        e.kind = info::kind;
        const auto rest = remaining(in.current(), in.end());
        const bool at_end = rest.empty();
        const bool literal = info::kind == ParseErrorKind::InvalidString || info::kind == ParseErrorKind::InvalidNumber;

        if(at_end && !literal){
            e.kind = ParseErrorKind::UnexpectedEof;
            e.detail = info::message ? info::message : "";
        } else if(!at_end && rest.front() == ')' &&
                  (std::is_same_v<Rule, grammar::top_expr> || std::is_same_v<Rule, tao::pegtl::eof>)){
            e.kind = ParseErrorKind::UnmatchedParen;
        } else if(info::message){
            e.detail = info::message;
        } else if(info::kind == ParseErrorKind::InvalidNumber){
            e.detail = "malformed numeric literal before '" + upcoming_token(rest) + "'";
        } else if(std::is_same_v<Rule, tao::pegtl::eof>){
            e.detail = "trailing input '" + std::string(rest.substr(0, rest.find('\n'))) + "'";
        } else if(info::kind == ParseErrorKind::GenericParseFailure){
            e.detail = "no expression at '" + upcoming_token(rest) + "'";
        } else {
            e.detail = "'" + upcoming_token(rest) + "'";
        }
        throw tlisp::parse_error(std::move(e));
    }
};

} // namespace tlisp::pegtl_front

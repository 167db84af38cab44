#pragma once
#include "prelude.hpp"
#include "grammar.hpp"
#include "tlisp/parser.hpp"
#include <tao/pegtl.hpp>
#include <charconv>
#include <cstdio>
#include <cstdlib>

namespace tlisp::pegtl_front::actions {
using namespace tao::pegtl;
using tlisp::pegtl_front::build_state;

template<typename Input>
SourcePos pos_of(const Input& in){
    auto p = in.position();
    return SourcePos{static_cast<int>(p.line), static_cast<int>(p.column)};
}

template<typename Rule>
struct action : nothing<Rule> {};

// --- atoms ---
template<> struct action< grammar::true_lit > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.exprs.push_back(make_expr(true, pos_of(in))); }
};
template<> struct action< grammar::false_lit > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.exprs.push_back(make_expr(false, pos_of(in))); }
};

// Integers take the narrowest of i32 / i64 that holds them.
template<> struct action< grammar::number > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        const std::string text = in.string();
        const SourcePos pos = pos_of(in);
        if(text.find('.') != std::string::npos){
            st.exprs.push_back(make_expr(std::strtod(text.c_str(), nullptr), pos));
            return;
        }
        const char* first = text.data();
        const char* last = text.data() + text.size();
        int32_t i32 = 0;
        if(auto [p, ec] = std::from_chars(first, last, i32); ec == std::errc() && p == last){
            st.exprs.push_back(make_expr(i32, pos));
            return;
        }
        int64_t i64 = 0;
        if(auto [p, ec] = std::from_chars(first, last, i64); ec == std::errc() && p == last){
            st.exprs.push_back(make_expr(i64, pos));
            return;
        }
        throw tlisp::parse_error(ParseError{ParseErrorKind::InvalidNumber, text + " does not fit in i64", pos.line, pos.col});
    }
};

template<> struct action< grammar::string_open > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.str.clear(); }
};
template<> struct action< grammar::plain_chars > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.str += in.string(); }
};
template<> struct action< grammar::escape_code > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        switch(in.peek_char()){
            case 'n': st.str += '\n'; break;
            case 't': st.str += '\t'; break;
            case 'r': st.str += '\r'; break;
            default: st.str += in.peek_char(); break; // '"' or '\\'
        }
    }
};
template<> struct action< grammar::string_lit > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.exprs.push_back(make_expr(st.str, pos_of(in))); }
};

template<> struct action< grammar::symbol > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.exprs.push_back(make_symbol(in.string(), pos_of(in))); }
};

// --- types ---
template<> struct action< grammar::base_type > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        // base_type only matches known names
        if(auto t = type_from_name(in.string())) st.types.push_back(*t);
    }
};
template<> struct action< grammar::fn_type_open > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.type_marks.push_back(st.types.size()); }
};
template<> struct action< grammar::fn_type > {
    template<typename Input>
    static void apply(const Input&, build_state& st){
        size_t from = st.type_marks.back(); st.type_marks.pop_back();
        auto parts = st.take_types(from);
        Type ret = parts.back(); parts.pop_back();
        st.types.push_back(Type::function(std::move(parts), std::move(ret)));
    }
};

// --- names ---
template<typename Input>
void push_name(const Input& in, build_state& st){ st.names.push_back(in.string()); }

template<> struct action< grammar::param_name > {
    template<typename Input> static void apply(const Input& in, build_state& st){ push_name(in, st); }
};
template<> struct action< grammar::let_name > {
    template<typename Input> static void apply(const Input& in, build_state& st){ push_name(in, st); }
};
template<> struct action< grammar::defn_name > {
    template<typename Input> static void apply(const Input& in, build_state& st){ push_name(in, st); }
};

// --- lists ---
template<> struct action< grammar::open_paren > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.opens.push_back(pos_of(in)); }
};
template<> struct action< grammar::form_mark > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.push_mark(); }
};

inline void trace_form(const build_state& st, const char* form, SourcePos pos){
    if(st.trace) std::fprintf(stderr, "[dbg][parse] %s at %d:%d\n", form, pos.line, pos.col);
}

inline std::vector<Param> zip_params(std::vector<std::string> names, std::vector<Type> types){
    std::vector<Param> out;
    for(size_t i=0;i<names.size() && i<types.size();++i) out.push_back(Param{std::move(names[i]), std::move(types[i])});
    return out;
}

template<> struct action< grammar::if_form > {
    template<typename Input>
    static void apply(const Input&, build_state& st){
        auto m = st.pop_mark();
        auto pos = st.pop_open();
        auto parts = st.take_exprs(m.exprs);
        trace_form(st, "if", pos);
        st.exprs.push_back(make_expr(If{parts[0], parts[1], parts[2]}, pos));
    }
};

template<> struct action< grammar::let_form > {
    template<typename Input>
    static void apply(const Input&, build_state& st){
        auto m = st.pop_mark();
        auto pos = st.pop_open();
        auto parts = st.take_exprs(m.exprs);
        auto types = st.take_types(m.types);
        auto names = st.take_names(m.names);
        Let l;
        l.name = names.front();
        if(!types.empty()) l.annotation = types.back();
        l.value = parts[0];
        if(parts.size() > 1) l.body = parts[1];
        trace_form(st, l.body ? "let-in" : "let", pos);
        st.exprs.push_back(make_expr(std::move(l), pos));
    }
};

template<> struct action< grammar::defn_form > {
    template<typename Input>
    static void apply(const Input&, build_state& st){
        auto m = st.pop_mark();
        auto pos = st.pop_open();
        auto parts = st.take_exprs(m.exprs);
        auto types = st.take_types(m.types);
        auto names = st.take_names(m.names);
        Defn d;
        d.name = names.front();
        d.ret = types.back();
        types.pop_back();
        names.erase(names.begin());
        d.params = zip_params(std::move(names), std::move(types));
        d.body = parts[0];
        trace_form(st, "defn", pos);
        st.exprs.push_back(make_expr(std::move(d), pos));
    }
};

template<> struct action< grammar::fn_form > {
    template<typename Input>
    static void apply(const Input&, build_state& st){
        auto m = st.pop_mark();
        auto pos = st.pop_open();
        auto parts = st.take_exprs(m.exprs);
        auto types = st.take_types(m.types);
        auto names = st.take_names(m.names);
        Lambda l;
        if(types.size() > names.size()){ l.ret = types.back(); types.pop_back(); }
        l.params = zip_params(std::move(names), std::move(types));
        l.body = parts[0];
        trace_form(st, "fn", pos);
        st.exprs.push_back(make_expr(std::move(l), pos));
    }
};

template<> struct action< grammar::generic_list > {
    template<typename Input>
    static void apply(const Input&, build_state& st){
        auto m = st.pop_mark();
        auto pos = st.pop_open();
        auto elems = st.take_exprs(m.exprs);
        if(elems.empty()){
            st.exprs.push_back(make_expr(List{}, pos));
            return;
        }
        ExprPtr callee = elems.front();
        elems.erase(elems.begin());
        trace_form(st, "call", pos);
        st.exprs.push_back(make_call(std::move(callee), std::move(elems), pos));
    }
};

} // namespace tlisp::pegtl_front::actions

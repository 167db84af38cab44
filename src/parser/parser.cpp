#include "tlisp/parser.hpp"
#include "prelude.hpp"
#include "grammar.hpp"
#include "actions.hpp"
#include "control.hpp"
#include <tao/pegtl.hpp>
#include <cstdio>

namespace tlisp {

const char* parse_error_code(ParseErrorKind kind){
    switch(kind){
        case ParseErrorKind::UnexpectedInput: return "P0001";
        case ParseErrorKind::UnexpectedEof: return "P0002";
        case ParseErrorKind::InvalidNumber: return "P0003";
        case ParseErrorKind::InvalidString: return "P0004";
        case ParseErrorKind::InvalidType: return "P0005";
        case ParseErrorKind::UnmatchedParen: return "P0006";
        case ParseErrorKind::GenericParseFailure: return "P0007";
    }
    return "P0007";
}

std::string ParseError::message() const {
    switch(kind){
        case ParseErrorKind::UnexpectedInput: return "Unexpected input: " + detail;
        case ParseErrorKind::UnexpectedEof: return detail.empty() ? "Unexpected end of input" : "Unexpected end of input: " + detail;
        case ParseErrorKind::InvalidNumber: return "Invalid number: " + detail;
        case ParseErrorKind::InvalidString: return "Invalid string: " + detail;
        case ParseErrorKind::InvalidType: return "Invalid type: " + detail;
        case ParseErrorKind::UnmatchedParen: return "Unmatched parenthesis";
        case ParseErrorKind::GenericParseFailure: return "Parse error: " + detail;
    }
    return "Parse error: " + detail;
}

Diagnostic to_diagnostic(const ParseError& e){
    std::string hint;
    switch(e.kind){
        case ParseErrorKind::UnexpectedEof: hint = "input ended early; check for a missing ')' or '\"'"; break;
        case ParseErrorKind::UnmatchedParen: hint = "remove the extra ')'"; break;
        case ParseErrorKind::InvalidType: hint = "types are i32, i64, f64, bool, String, _ or fn(T, ...) -> T"; break;
        case ParseErrorKind::InvalidString: hint = "valid escapes are \\\" \\\\ \\n \\t \\r"; break;
        default: break;
    }
    return ErrorReporter::make(Stage::Parse, parse_error_code(e.kind), e.message(), std::move(hint), e.line, e.column);
}

ParseResult Parser::parse_string(std::string_view src, std::string_view filename) const {
    using namespace tlisp::pegtl_front;
    tao::pegtl::memory_input in(src.data(), src.size(), std::string(filename));
    build_state st;
    st.trace = opts_.debug_parse;
    ParseResult r;
    try {
        if(tao::pegtl::parse< grammar::file, actions::action, control >(in, st) && st.exprs.size() == 1){
            r.success = true;
            r.expr = st.exprs.back();
            return r;
        }
        r.error = ParseError{ParseErrorKind::GenericParseFailure, "no expression", 1, 1};
    } catch(const tlisp::parse_error& e){
        r.error = e.error;
    } catch(const tao::pegtl::parse_error& e){
        const auto& p = e.positions().front();
        r.error = ParseError{ParseErrorKind::GenericParseFailure, e.what(), static_cast<int>(p.line), static_cast<int>(p.column)};
    }
    if(opts_.debug_parse) std::fprintf(stderr, "[dbg][parse] failed %s at %d:%d\n", r.error.message().c_str(), r.error.line, r.error.column);
    return r;
}

ExprPtr parse(std::string_view src){
    auto r = Parser{}.parse_string(src);
    if(!r.success) throw parse_error(r.error);
    return r.expr;
}

} // namespace tlisp

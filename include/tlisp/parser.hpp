#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
#include "tlisp/ast.hpp"
#include "tlisp/diagnostics.hpp"
#include "tlisp/options.hpp"

namespace tlisp {

enum class ParseErrorKind {
    UnexpectedInput,
    UnexpectedEof,
    InvalidNumber,
    InvalidString,
    InvalidType,
    UnmatchedParen,
    GenericParseFailure
};

// "P0001" .. "P0007" in declaration order.
const char* parse_error_code(ParseErrorKind kind);

struct ParseError {
    ParseErrorKind kind{ParseErrorKind::GenericParseFailure};
    std::string detail;
    int line{0};
    int column{0};
    // "Unexpected input: ...", "Unexpected end of input", "Invalid number: ..." etc.
    std::string message() const;
};

struct parse_error : std::runtime_error {
    explicit parse_error(ParseError e): std::runtime_error(e.message()), error(std::move(e)){}
    ParseError error;
};

struct ParseResult {
    bool success{false};
    ExprPtr expr;      // set on success
    ParseError error;  // set on failure
};

Diagnostic to_diagnostic(const ParseError& e);

class Parser {
public:
    Parser() = default;
    explicit Parser(Options opts): opts_(opts){}

    // Parses exactly one expression; anything but trailing whitespace or comments is an error.
    ParseResult parse_string(std::string_view src, std::string_view filename = "<memory>") const;

private:
    Options opts_{};
};

// Throwing convenience wrapper around Parser::parse_string.
ExprPtr parse(std::string_view src);

} // namespace tlisp

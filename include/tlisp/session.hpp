// Persistent parse -> check -> eval pipeline over one pair of root environments.
#pragma once
#include "tlisp/ast.hpp"
#include "tlisp/diagnostics.hpp"
#include "tlisp/env.hpp"
#include "tlisp/options.hpp"
#include "tlisp/parser.hpp"
#include "tlisp/types.hpp"
#include "tlisp/value.hpp"
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace tlisp {

struct RunResult {
    bool success=false;
    Stage stage=Stage::Parse;  // failing stage; Eval when everything ran
    Value value;
    Type type;
    std::string error;         // first error message
    std::vector<Diagnostic> diagnostics;
    std::vector<Diagnostic> warnings;
};

class Session {
public:
    // Uses detect_options(); print/println write to `out`, which must outlive the session.
    explicit Session(std::ostream& out);
    Session(std::ostream& out, Options opts);

    RunResult run(std::string_view src);
    RunResult run_expr(const Expr& e);

    // "value: type" or "Error: message"
    static std::string render(const RunResult& r);

    const TypeEnvPtr& type_env() const { return types_; }
    const ValueEnvPtr& value_env() const { return values_; }
    Options& options() { return opts_; }

private:
    Options opts_;
    TypeEnvPtr types_;
    ValueEnvPtr values_;

    RunResult fail(RunResult r, Stage stage, std::vector<Diagnostic> errors);
};

} // namespace tlisp

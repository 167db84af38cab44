#include "tlisp/session.hpp"
#include "tlisp/builtins.hpp"
#include "tlisp/diagnostics_json.hpp"
#include "tlisp/eval.hpp"
#include "tlisp/type_check.hpp"

namespace tlisp {

Session::Session(std::ostream& out): Session(out, detect_options()){}

Session::Session(std::ostream& out, Options opts)
    : opts_(opts), types_(TypeEnv::make_root()), values_(ValueEnv::make_root()){
    install_builtin_types(*types_);
    install_builtins(*values_, out);
}

RunResult Session::fail(RunResult r, Stage stage, std::vector<Diagnostic> errors){
    r.success = false;
    r.stage = stage;
    r.diagnostics = std::move(errors);
    if(!r.diagnostics.empty()) r.error = r.diagnostics.front().message;
    maybe_print_json(opts_, false, r.diagnostics, r.warnings);
    return r;
}

RunResult Session::run(std::string_view src){
    auto parsed = Parser(opts_).parse_string(src, "<input>");
    if(!parsed.success) return fail(RunResult{}, Stage::Parse, {to_diagnostic(parsed.error)});
    return run_expr(*parsed.expr);
}

RunResult Session::run_expr(const Expr& e){
    RunResult r;
    // a failed input must leave no bindings behind in either root scope
    auto type_snapshot = types_->bindings();
    auto value_snapshot = values_->bindings();

    auto checked = TypeChecker(opts_).check(e, types_);
    r.warnings = checked.warnings;
    if(!checked.success){
        types_->restore(std::move(type_snapshot));
        return fail(std::move(r), Stage::Check, std::move(checked.errors));
    }

    auto evaluated = Evaluator(opts_).eval(e, values_);
    if(!evaluated.success){
        types_->restore(std::move(type_snapshot));
        values_->restore(std::move(value_snapshot));
        return fail(std::move(r), Stage::Eval, {evaluated.diagnostic});
    }

    r.success = true;
    r.stage = Stage::Eval;
    r.value = std::move(evaluated.value);
    r.type = checked.type;
    maybe_print_json(opts_, true, r.diagnostics, r.warnings);
    return r;
}

std::string Session::render(const RunResult& r){
    if(!r.success) return "Error: " + r.error;
    return to_string(r.value) + ": " + to_string(r.type);
}

} // namespace tlisp

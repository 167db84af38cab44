// Shared diagnostic records for parse, check and eval failures.
#pragma once
#include <string>
#include <vector>

namespace tlisp {

enum class Stage { Parse, Check, Eval };

inline const char* stage_name(Stage s){
    switch(s){ case Stage::Parse: return "parse"; case Stage::Check: return "check"; case Stage::Eval: return "eval"; }
    return "?";
}

struct DiagnosticNote { std::string message; int line=-1; int col=-1; };
struct Diagnostic { Stage stage=Stage::Check; std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::vector<DiagnosticNote> notes; };

// Central reporter so every stage formats records the same way.
struct ErrorReporter {
    std::vector<Diagnostic>* errors=nullptr;
    std::vector<Diagnostic>* warnings=nullptr;
    void emit_error(const Diagnostic& e){ if(errors) errors->push_back(e); }
    void emit_warning(const Diagnostic& w){ if(warnings) warnings->push_back(w); }
    static Diagnostic make(Stage stage, std::string code, std::string message, std::string hint, int line, int col){
        return Diagnostic{stage,std::move(code),std::move(message),std::move(hint),line,col,{}};
    }
};

// "E0100 Undefined variable: x (line 1, col 2)" followed by indented notes.
inline std::string format_diagnostic(const Diagnostic& d){
    std::string out = d.code + " " + d.message;
    if(d.line>=0) out += " (line " + std::to_string(d.line) + ", col " + std::to_string(d.col) + ")";
    if(!d.hint.empty()) out += "\n  hint: " + d.hint;
    for(auto& n : d.notes) out += "\n  note: " + n.message;
    return out;
}

} // namespace tlisp

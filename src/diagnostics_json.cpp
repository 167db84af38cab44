#include "tlisp/diagnostics_json.hpp"
#include <sstream>
#include <cstdio>

namespace tlisp {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static void append_notes_json(std::ostringstream& os, const std::vector<DiagnosticNote>& notes){
    os<<"[";
    for(size_t i=0;i<notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(notes[i].message)
          <<",\"line\":"<<notes[i].line
          <<",\"col\":"<<notes[i].col
          <<"}";
    }
    os<<"]";
}

static void append_diagnostics_json(std::ostringstream& os, const std::vector<Diagnostic>& ds){
    os<<"[";
    for(size_t i=0;i<ds.size(); ++i){
        const auto &d=ds[i]; if(i) os<<",";
        os<<"{"
            "\"stage\":"<<json_escape(stage_name(d.stage))
            <<",\"code\":"<<json_escape(d.code)
            <<",\"message\":"<<json_escape(d.message)
            <<",\"hint\":"<<json_escape(d.hint)
            <<",\"line\":"<<d.line
            <<",\"col\":"<<d.col
            <<",\"notes\":";
        append_notes_json(os,d.notes);
        os<<"}";
    }
    os<<"]";
}

std::string diagnostics_to_json(bool success, const std::vector<Diagnostic>& errors, const std::vector<Diagnostic>& warnings){
    std::ostringstream os;
    os<<"{\"success\":"<<(success?"true":"false")<<",\"errors\":";
    append_diagnostics_json(os, errors);
    os<<",\"warnings\":";
    append_diagnostics_json(os, warnings);
    os<<"}";
    return os.str();
}

std::string diagnostics_to_json(const TypeCheckResult& r){
    return diagnostics_to_json(r.success, r.errors, r.warnings);
}

void maybe_print_json(const Options& opts, bool success, const std::vector<Diagnostic>& errors, const std::vector<Diagnostic>& warnings){
    if(!opts.diag_json) return;
    if(success && errors.empty() && warnings.empty()) return;
    auto js=diagnostics_to_json(success, errors, warnings);
    std::fprintf(stderr, "%s\n", js.c_str());
}

} // namespace tlisp

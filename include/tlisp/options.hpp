#pragma once
#include <cstdlib>
#include <string>

namespace tlisp {

// Process-wide switches, normally read once from the environment.
struct Options {
    bool suggest = true;      // "did you mean" notes on undefined names
    bool lint = true;         // unused parameter / binding warnings
    bool diag_json = false;   // dump diagnostics as JSON to stderr
    bool debug_parse = false; // [dbg][parse] tracing
    bool debug_eval = false;  // [dbg][eval] tracing
    unsigned max_call_depth = 10000;
};

// Feature flags sourced from environment
inline bool env_flag_enabled(const char *name)
{
    const char *v = std::getenv(name);
    return v && (v[0] == '1' || v[0] == 't' || v[0] == 'T' || v[0] == 'y' || v[0] == 'Y');
}

// TLISP_SUGGEST=0 / TLISP_LINT=0 disable, TLISP_DIAG_JSON, TLISP_DEBUG_PARSE and
// TLISP_DEBUG_EVAL enable, TLISP_MAX_DEPTH overrides the call depth limit.
Options detect_options();

} // namespace tlisp

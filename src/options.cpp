#include "tlisp/options.hpp"

namespace tlisp {

Options detect_options(){
    Options o{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("TLISP_SUGGEST")) o.suggest = (v[0] != '0');
    if (const char* v = get("TLISP_LINT")) o.lint = (v[0] != '0');
    o.diag_json = env_flag_enabled("TLISP_DIAG_JSON");
    o.debug_parse = env_flag_enabled("TLISP_DEBUG_PARSE");
    o.debug_eval = env_flag_enabled("TLISP_DEBUG_EVAL");

    if (const char* v = get("TLISP_MAX_DEPTH")){
        char* end = nullptr;
        unsigned long n = std::strtoul(v, &end, 10);
        if(end && *end == '\0' && n > 0) o.max_call_depth = static_cast<unsigned>(n);
    }
    return o;
}

} // namespace tlisp

// diagnostics_json.hpp - JSON serialization for diagnostics of any stage
#pragma once
#include "tlisp/diagnostics.hpp"
#include "tlisp/options.hpp"
#include "tlisp/type_check.hpp"
#include <string>
#include <vector>

namespace tlisp {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string:
// {"success":..,"errors":[{"stage","code","message","hint","line","col","notes"}..],"warnings":[..]}
std::string diagnostics_to_json(bool success, const std::vector<Diagnostic>& errors, const std::vector<Diagnostic>& warnings);
std::string diagnostics_to_json(const TypeCheckResult& r);

// With diag_json enabled, print diagnostics JSON to stderr when there is anything to report.
void maybe_print_json(const Options& opts, bool success, const std::vector<Diagnostic>& errors, const std::vector<Diagnostic>& warnings);

} // namespace tlisp

// JSON diagnostics output
#include <gtest/gtest.h>
#include "tlisp/builtins.hpp"
#include "tlisp/diagnostics_json.hpp"
#include "tlisp/parser.hpp"
#include "tlisp/type_check.hpp"

using namespace tlisp;

static bool contains(const std::string& hay, const std::string& needle){ return hay.find(needle) != std::string::npos; }

static TypeCheckResult check_src(const std::string& src){
    auto env = TypeEnv::make_root();
    install_builtin_types(*env);
    return TypeChecker().check(*parse(src), env);
}

TEST(DiagnosticsJsonTest, EscapesStrings){
    EXPECT_EQ(json_escape("plain"), "\"plain\"");
    EXPECT_EQ(json_escape("a\"b\\c\n\t"), "\"a\\\"b\\\\c\\n\\t\"");
    EXPECT_EQ(json_escape(std::string(1, '\x01')), "\"\\u0001\"");
}

TEST(DiagnosticsJsonTest, SuccessWithoutDiagnostics){
    auto js = diagnostics_to_json(check_src("(+ 1 2)"));
    EXPECT_EQ(js, "{\"success\":true,\"errors\":[],\"warnings\":[]}");
}

TEST(DiagnosticsJsonTest, CheckErrorCarriesNotes){
    auto js = diagnostics_to_json(check_src("(if 1 2 3)"));
    EXPECT_TRUE(contains(js, "\"success\":false"));
    EXPECT_TRUE(contains(js, "\"stage\":\"check\""));
    EXPECT_TRUE(contains(js, "\"code\":\"E0200\""));
    EXPECT_TRUE(contains(js, "\"line\":1,\"col\":5"));
    EXPECT_TRUE(contains(js, "{\"message\":\"expected: bool\""));
}

TEST(DiagnosticsJsonTest, WarningsAreListedSeparately){
    auto js = diagnostics_to_json(check_src("(fn [unused: i32] 0)"));
    EXPECT_TRUE(contains(js, "\"success\":true,\"errors\":[],\"warnings\":[{"));
    EXPECT_TRUE(contains(js, "\"code\":\"W0700\""));
    EXPECT_TRUE(contains(js, "unused parameter 'unused'"));
}

TEST(DiagnosticsJsonTest, ParseDiagnostic){
    auto r = Parser().parse_string(")");
    ASSERT_FALSE(r.success);
    auto js = diagnostics_to_json(false, {to_diagnostic(r.error)}, {});
    EXPECT_TRUE(contains(js, "\"stage\":\"parse\""));
    EXPECT_TRUE(contains(js, "\"code\":\"P0006\""));
    EXPECT_TRUE(contains(js, "\"message\":\"Unmatched parenthesis\""));
}

TEST(DiagnosticsJsonTest, FormatDiagnosticText){
    auto r = check_src("(if 1 2 3)");
    auto text = format_diagnostic(r.errors.front());
    EXPECT_EQ(text.rfind("E0200 If condition must be bool, got i32 (line 1, col 5)", 0), 0u);
    EXPECT_TRUE(contains(text, "\n  note: expected: bool"));
}

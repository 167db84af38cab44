// Unused parameter / binding warnings
#include <gtest/gtest.h>
#include "tlisp/builtins.hpp"
#include "tlisp/parser.hpp"
#include "tlisp/type_check.hpp"

using namespace tlisp;

static bool has_warning(const TypeCheckResult& r, const std::string& code){
    for(const auto& w : r.warnings) if(w.code==code) return true;
    return false;
}

static TypeCheckResult lint(const std::string& src, Options opts = {}){
    auto env = TypeEnv::make_root();
    install_builtin_types(*env);
    return TypeChecker(opts).check(*parse(src), env);
}

TEST(LintsTest, UnusedLambdaParameter){
    auto r = lint("(fn [x: i32 y: i32] x)");
    ASSERT_TRUE(r.success);
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_EQ(r.warnings[0].code, "W0700");
    EXPECT_EQ(r.warnings[0].message, "unused parameter 'y'");
}

TEST(LintsTest, UnusedDefnParameter){
    auto r = lint("(defn k [a: i32 b: i32] -> i32 a)");
    ASSERT_TRUE(r.success);
    EXPECT_TRUE(has_warning(r, "W0700"));
}

TEST(LintsTest, RecursiveUseDoesNotCountAgainstParameters){
    auto r = lint("(defn down [n: i32] -> i32 (if (= n 0) 0 (down (- n 1))))");
    ASSERT_TRUE(r.success);
    EXPECT_TRUE(r.warnings.empty());
}

TEST(LintsTest, UnusedLetBinding){
    auto r = lint("(let a 1 2)");
    ASSERT_TRUE(r.success);
    ASSERT_TRUE(has_warning(r, "W0701"));
    EXPECT_EQ(r.warnings[0].message, "unused binding 'a'");
    // sequential lets have no body to check against
    EXPECT_TRUE(lint("(let a 1)").warnings.empty());
}

TEST(LintsTest, UnderscorePrefixSilences){
    EXPECT_TRUE(lint("(fn [_y: i32] 1)").warnings.empty());
    EXPECT_TRUE(lint("(let _tmp 1 2)").warnings.empty());
}

TEST(LintsTest, DisabledByOption){
    Options opts;
    opts.lint = false;
    auto r = lint("(fn [x: i32 y: i32] 1)", opts);
    ASSERT_TRUE(r.success);
    EXPECT_TRUE(r.warnings.empty());
}

TEST(LintsTest, WarningsNeverFailTheCheck){
    auto r = lint("(let unused 1 (fn [p: i32] 0))");
    EXPECT_TRUE(r.success);
    EXPECT_TRUE(has_warning(r, "W0700"));
    EXPECT_TRUE(has_warning(r, "W0701"));
}

#include <gtest/gtest.h>
#include "tlisp/env.hpp"
#include "tlisp/value.hpp"

using namespace tlisp;

TEST(EnvTest, LookupWalksOutward){
    auto root = TypeEnv::make_root();
    root->define("x", i32_type());
    auto child = root->extend();
    auto grandchild = child->extend();
    ASSERT_NE(grandchild->lookup("x"), nullptr);
    EXPECT_EQ(*grandchild->lookup("x"), i32_type());
    EXPECT_EQ(grandchild->lookup("y"), nullptr);
    EXPECT_EQ(grandchild->depth(), 2u);
    EXPECT_EQ(root->depth(), 0u);
}

TEST(EnvTest, InnerBindingShadowsWithoutTouchingParent){
    auto root = TypeEnv::make_root();
    root->define("x", i32_type());
    auto child = root->extend();
    child->define("x", string_type());
    EXPECT_EQ(*child->lookup("x"), string_type());
    EXPECT_EQ(*root->lookup("x"), i32_type());
    EXPECT_TRUE(child->contains_local("x"));
    child->define("only_child", bool_type());
    EXPECT_EQ(root->lookup("only_child"), nullptr);
}

TEST(EnvTest, RedefineOverwritesInPlace){
    auto root = ValueEnv::make_root();
    root->define("n", Value(int32_t(1)));
    root->define("n", Value("now a string"));
    EXPECT_EQ(*root->lookup("n"), Value("now a string"));
    EXPECT_EQ(root->bindings().size(), 1u);
}

TEST(EnvTest, ChildKeepsParentAlive){
    ValueEnvPtr child;
    {
        auto root = ValueEnv::make_root();
        root->define("kept", Value(int32_t(7)));
        child = root->extend();
    }
    ASSERT_NE(child->lookup("kept"), nullptr);
    EXPECT_EQ(*child->lookup("kept"), Value(int32_t(7)));
}

TEST(EnvTest, SnapshotAndRestore){
    auto root = TypeEnv::make_root();
    root->define("a", i32_type());
    auto snapshot = root->bindings();
    root->define("b", i64_type());
    root->define("a", bool_type());
    root->restore(std::move(snapshot));
    EXPECT_EQ(root->lookup("b"), nullptr);
    EXPECT_EQ(*root->lookup("a"), i32_type());
}

TEST(EnvTest, VisibleNamesAreSortedAndUnique){
    auto root = TypeEnv::make_root();
    root->define("zeta", i32_type());
    root->define("alpha", i32_type());
    auto child = root->extend();
    child->define("alpha", bool_type());
    child->define("mid", bool_type());
    EXPECT_EQ(child->visible_names(), (std::vector<std::string>{"alpha", "mid", "zeta"}));
}

#include <gtest/gtest.h>
#include "tlisp/types.hpp"

using namespace tlisp;

TEST(TypesTest, BaseTypeDisplay){
    EXPECT_EQ(to_string(i32_type()), "i32");
    EXPECT_EQ(to_string(i64_type()), "i64");
    EXPECT_EQ(to_string(f64_type()), "f64");
    EXPECT_EQ(to_string(bool_type()), "bool");
    EXPECT_EQ(to_string(string_type()), "String");
    EXPECT_EQ(to_string(Type::inferred()), "_");
}

TEST(TypesTest, FunctionTypeDisplayNestsToTheRight){
    auto inner = Type::function({i32_type()}, i32_type());
    EXPECT_EQ(to_string(Type::function({i32_type(), i64_type()}, bool_type())), "fn(i32, i64) -> bool");
    EXPECT_EQ(to_string(Type::function({}, string_type())), "fn() -> String");
    EXPECT_EQ(to_string(Type::function({i32_type()}, inner)), "fn(i32) -> fn(i32) -> i32");
    EXPECT_EQ(to_string(Type::function({inner, i32_type()}, i32_type())), "fn(fn(i32) -> i32, i32) -> i32");
}

TEST(TypesTest, EqualityIsStructural){
    EXPECT_EQ(i32_type(), i32_type());
    EXPECT_NE(i32_type(), i64_type());
    EXPECT_EQ(Type::inferred(), Type::inferred());
    EXPECT_NE(Type::inferred(), i32_type());
    auto a = Type::function({i32_type(), bool_type()}, f64_type());
    auto b = Type::function({i32_type(), bool_type()}, f64_type());
    EXPECT_EQ(a, b);
    EXPECT_NE(a, Type::function({i32_type()}, f64_type()));
    EXPECT_NE(a, Type::function({i32_type(), bool_type()}, i32_type()));
    EXPECT_NE(a, Type::function({i64_type(), bool_type()}, f64_type()));
}

TEST(TypesTest, KindPredicates){
    auto f = Type::function({i32_type()}, bool_type());
    EXPECT_TRUE(f.is_function());
    EXPECT_EQ(f.return_type(), bool_type());
    EXPECT_TRUE(Type::inferred().is_inferred());
    EXPECT_TRUE(string_type().is_base(BaseType::String));
    EXPECT_FALSE(string_type().is_base(BaseType::I32));
}

TEST(TypesTest, TypeFromName){
    EXPECT_EQ(type_from_name("i32"), i32_type());
    EXPECT_EQ(type_from_name("String"), string_type());
    EXPECT_TRUE(type_from_name("_")->is_inferred());
    EXPECT_FALSE(type_from_name("string").has_value());
    EXPECT_FALSE(type_from_name("Foo").has_value());
}

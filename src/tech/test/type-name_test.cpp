#include "type-name.hpp"

#include <gtest/gtest.h>

#include <string_view>

namespace sysx {

namespace test {
struct Widget {};
}  // namespace test

TEST(TypeName, FundamentalTypes) {
  EXPECT_EQ(TypeName<int>(), "int");
  EXPECT_EQ(TypeName<double>(), "double");
  EXPECT_EQ(TypeName(3.5F), "float");
}

TEST(TypeName, UserDefinedType) {
  EXPECT_EQ(TypeName<test::Widget>(), "sysx::test::Widget");
  EXPECT_EQ(SimplifyType(TypeName<test::Widget>()), "Widget");
}

TEST(TypeName, IsListLike) {
  EXPECT_TRUE(IsListLike("std::vector<int>"));
  EXPECT_TRUE(IsListLike(" [u8; 4] "));
  EXPECT_TRUE(IsListLike("a>"));
  EXPECT_FALSE(IsListLike("std::string"));
  EXPECT_FALSE(IsListLike("[u8"));
  EXPECT_FALSE(IsListLike(""));
}

TEST(TypeName, SimplifyNonListType) {
  EXPECT_EQ(SimplifyNonListType("std::string"), "string");
  EXPECT_EQ(SimplifyNonListType("a::b::c::Type"), "Type");
  EXPECT_EQ(SimplifyNonListType("int"), "int");
  EXPECT_EQ(SimplifyNonListType(""), "");
}

TEST(TypeName, SimplifyType) {
  EXPECT_EQ(SimplifyType("std::string"), "string");
  EXPECT_EQ(SimplifyType("std::vector<std::string>"), "vector<string>");
  EXPECT_EQ(SimplifyType("std::map<a::K, b::V>"), "map<K, V>");
  EXPECT_EQ(SimplifyType("std::map<a::K, b::V>, c::D"), "map<K, V>, D");
  EXPECT_EQ(SimplifyType("std::optional<std::pair<x::A, y::z::B>>"), "optional<pair<A, B>>");
  EXPECT_EQ(SimplifyType("[core::u8; 4]"), "[u8; 4]");
}

}  // namespace sysx

#include "stringhelpers.hpp"

#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "sysx_string.hpp"

namespace sysx {

TEST(StringHelpers, TrimSpaces) {
  EXPECT_EQ(TrimSpaces(""), "");
  EXPECT_EQ(TrimSpaces("   "), "");
  EXPECT_EQ(TrimSpaces(" \t echo  hello \n"), "echo  hello");
  EXPECT_EQ(TrimSpaces("ls"), "ls");
}

TEST(StringHelpers, Join) {
  EXPECT_EQ(Join<string>(std::vector<std::string_view>{}, " "), "");
  EXPECT_EQ(Join<string>(std::vector<std::string_view>{"prog"}, " "), "prog");
  EXPECT_EQ(Join<string>(std::vector<std::string_view>{"prog", "", "arg2"}, " "), "prog  arg2");
  EXPECT_EQ(Join<string>(std::vector<string>{"a", "b", "c"}, ", "), "a, b, c");
}

}  // namespace sysx

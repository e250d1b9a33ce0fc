#include "toupperlower-string.hpp"

#include <gtest/gtest.h>

namespace sysx {

TEST(ToUpperLowerStringTest, ToLowerTest) {
  EXPECT_EQ(ToLower("HELLO"), "hello");
  EXPECT_EQ(ToLower("Hello"), "hello");
  EXPECT_EQ(ToLower("1.5MS"), "1.5ms");
  EXPECT_EQ(ToLower(" "), " ");
  EXPECT_EQ(ToLower(""), "");
}

}  // namespace sysx

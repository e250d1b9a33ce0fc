#include "sysx_exception.hpp"

#include <gtest/gtest.h>

#include "sysx_invalid_argument_exception.hpp"

namespace sysx {

TEST(SysxExceptionTest, InfoTakenFromConstCharStar) {
  EXPECT_STREQ(exception("This string can fill the inline storage").what(), "This string can fill the inline storage");
}

TEST(SysxExceptionTest, FormatUntruncated) {
  EXPECT_STREQ(exception("Unknown radix {}. Please use 2 or 16.", 7).what(), "Unknown radix 7. Please use 2 or 16.");
}

TEST(SysxExceptionTest, FormatTruncated) {
  EXPECT_STREQ(exception("This is a {} that will not {} and it will be {} because it's too {}", "string",
                         "fit inside the buffer", "truncated", "long")
                   .what(),
               "This is a string that will not fit inside the buffer and it will be truncated becaus...");
}

TEST(SysxExceptionTest, InvalidArgumentIsAnException) {
  EXPECT_THROW(throw invalid_argument("Bad value {}", 42), exception);
  EXPECT_STREQ(invalid_argument("Bad value {}", 42).what(), "Bad value 42");
}

}  // namespace sysx

#include "timedef.hpp"

#include <gtest/gtest.h>

namespace sysx {

TEST(TimeDefinitions, TimestampToMillisecondsSinceEpoch) {
  EXPECT_EQ(TimestampToMillisecondsSinceEpoch(TimePoint{}), 0);
  EXPECT_EQ(TimestampToMillisecondsSinceEpoch(TimePoint(seconds(1700000000)) + microseconds(1999)),
            1700000000001);
}

}  // namespace sysx

#include "stringconv.hpp"

#include <gtest/gtest.h>

#include <cstdint>

#include "sysx_exception.hpp"

namespace sysx {

TEST(StringToIntegral, Decimal) {
  EXPECT_EQ(StringToIntegral("0"), 0);
  EXPECT_EQ(StringToIntegral("-293486"), -293486);
  EXPECT_EQ(StringToIntegral<uint16_t>("65535"), 65535);
}

TEST(StringToIntegral, Octal) {
  EXPECT_EQ(StringToIntegral<uint32_t>("755", 8), 0755U);
  EXPECT_EQ(StringToIntegral<uint32_t>("644", 8), 0644U);
}

TEST(StringToIntegral, Binary) { EXPECT_EQ(StringToIntegral<uint8_t>("01001000", 2), 'H'); }

TEST(StringToIntegral, Invalid) {
  EXPECT_THROW(StringToIntegral(""), exception);
  EXPECT_THROW(StringToIntegral("abc"), exception);
  EXPECT_THROW(StringToIntegral("12a"), exception);
  EXPECT_THROW(StringToIntegral<uint32_t>("789", 8), exception);
  EXPECT_THROW(StringToIntegral<uint8_t>("256"), exception);
}

}  // namespace sysx

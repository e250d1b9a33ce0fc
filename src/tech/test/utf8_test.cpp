#include "utf8.hpp"

#include <gtest/gtest.h>

#include <string_view>

namespace sysx {

TEST(UTF8Test, NbBytes) {
  EXPECT_EQ(nb_bytes_utf8(0x24), 1);
  EXPECT_EQ(nb_bytes_utf8(0xA2), 2);
  EXPECT_EQ(nb_bytes_utf8(0x20AC), 3);
  EXPECT_EQ(nb_bytes_utf8(0x10348), 4);
}

TEST(UTF8Test, ValidSequences) {
  EXPECT_TRUE(IsValidUtf8(std::string_view("")));
  EXPECT_TRUE(IsValidUtf8(std::string_view("Hello")));
  EXPECT_TRUE(IsValidUtf8(std::string_view("$ ¢ € 𐍈 😀")));
  EXPECT_TRUE(IsValidUtf8(std::string_view("수량은 소수점 8자리까지만 유효합니다.")));
  // U+10FFFF, highest code point
  EXPECT_TRUE(IsValidUtf8(std::string_view("\xF4\x8F\xBF\xBF")));
  EXPECT_TRUE(IsValidUtf8(std::string_view("\0", 1)));
}

TEST(UTF8Test, InvalidSequences) {
  EXPECT_FALSE(IsValidUtf8(std::string_view("\xFF\xFF")));
  // lonely continuation byte
  EXPECT_FALSE(IsValidUtf8(std::string_view("a\x80z")));
  // overlong encodings
  EXPECT_FALSE(IsValidUtf8(std::string_view("\xC0\xAF")));
  EXPECT_FALSE(IsValidUtf8(std::string_view("\xE0\x80\xAF")));
  // surrogate U+D800
  EXPECT_FALSE(IsValidUtf8(std::string_view("\xED\xA0\x80")));
  // above U+10FFFF
  EXPECT_FALSE(IsValidUtf8(std::string_view("\xF4\x90\x80\x80")));
  // truncated sequences
  EXPECT_FALSE(IsValidUtf8(std::string_view("\xE2\x82")));
  EXPECT_FALSE(IsValidUtf8(std::string_view("abc\xF0\x9F\x98")));
  // continuation byte expected
  EXPECT_FALSE(IsValidUtf8(std::string_view("\xC3\x28")));
}

TEST(UTF8Test, IsUnicodeWhiteSpace) {
  EXPECT_TRUE(IsUnicodeWhiteSpace(' '));
  EXPECT_TRUE(IsUnicodeWhiteSpace('\t'));
  EXPECT_TRUE(IsUnicodeWhiteSpace(0x85));
  EXPECT_TRUE(IsUnicodeWhiteSpace(0xA0));
  EXPECT_TRUE(IsUnicodeWhiteSpace(0x2000));
  EXPECT_TRUE(IsUnicodeWhiteSpace(0x200A));
  EXPECT_TRUE(IsUnicodeWhiteSpace(0x3000));
  EXPECT_FALSE(IsUnicodeWhiteSpace('a'));
  EXPECT_FALSE(IsUnicodeWhiteSpace(0x200B));
  EXPECT_FALSE(IsUnicodeWhiteSpace(0xFEFF));
}

TEST(UTF8Test, Utf8WhiteSpaceLength) {
  EXPECT_EQ(Utf8WhiteSpaceLength(" a", 0), 1U);
  EXPECT_EQ(Utf8WhiteSpaceLength(" a", 1), 0U);
  EXPECT_EQ(Utf8WhiteSpaceLength("a\xC2\xA0", 1), 2U);
  EXPECT_EQ(Utf8WhiteSpaceLength("\xE2\x80\x83", 0), 3U);
  // U+00E9 is a letter
  EXPECT_EQ(Utf8WhiteSpaceLength("\xC3\xA9", 0), 0U);
  EXPECT_EQ(Utf8WhiteSpaceLength("\xE2\x80", 0), 0U);
}

}  // namespace sysx

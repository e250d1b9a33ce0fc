#include "bin.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>
#include <vector>

#include "codec-error.hpp"

namespace sysx::bin {

namespace {
CodecErrc DecodeErrc(std::string_view input) {
  try {
    Decode(input);
  } catch (const codec_error &e) {
    return e.errc();
  }
  ADD_FAILURE() << "Expected a codec_error for '" << input << "'";
  return CodecErrc::kParseInt;
}
}  // namespace

TEST(Bin, EncodeSingleChar) { EXPECT_EQ(Encode("H"), "01001000"); }

TEST(Bin, EncodeTwoChars) { EXPECT_EQ(Encode("Hi"), "01001000 01101001"); }

TEST(Bin, EncodeEmpty) { EXPECT_EQ(Encode(""), ""); }

TEST(Bin, EncodeSpecialChars) { EXPECT_EQ(Encode("!@#"), "00100001 01000000 00100011"); }

TEST(Bin, EncodeNonAscii) { EXPECT_EQ(Encode("é"), "11000011 10101001"); }

TEST(Bin, DecodeBasic) {
  EXPECT_EQ(Decode("01001000"), "H");
  EXPECT_EQ(Decode("01001000 01100101 01101100 01101100 01101111"), "Hello");
}

TEST(Bin, DecodeIgnoresNoiseAndSeparators) {
  EXPECT_EQ(Decode("0100 1000 !@#"), "H");
  EXPECT_EQ(Decode("01001000\t01101001\n"), "Hi");
}

TEST(Bin, DecodeMisalignedLength) {
  EXPECT_THROW(Decode("010010"), codec_error);
  EXPECT_EQ(DecodeErrc("010010"), CodecErrc::kMisalignedLength);
}

TEST(Bin, DecodeEmpty) {
  EXPECT_EQ(DecodeErrc(""), CodecErrc::kEmptyInput);
  EXPECT_EQ(DecodeErrc("xyz"), CodecErrc::kEmptyInput);
}

TEST(Bin, DecodeInvalidUtf8) {
  EXPECT_EQ(DecodeErrc("11111111 11111111"), CodecErrc::kInvalidUtf8);

  try {
    Decode("11111111 11111111");
  } catch (const codec_error &e) {
    EXPECT_TRUE(e.isInvalidSyntax());
    EXPECT_FALSE(e.isParseInt());
  }
}

TEST(Bin, DecodeBytesDoesNotCheckUtf8) {
  EXPECT_EQ(DecodeBytes("11111111 00000001"), (std::vector<uint8_t>{0xFF, 0x01}));
}

TEST(Bin, Check) {
  EXPECT_TRUE(Check("0100 1000"));
  EXPECT_TRUE(Check("01001000"));
  EXPECT_TRUE(Check("010"));
  EXPECT_TRUE(Check("0100\t1000\n"));
  EXPECT_FALSE(Check("0100x1000"));
  EXPECT_FALSE(Check("0100 1002"));
  EXPECT_FALSE(Check(""));
}

TEST(Bin, CheckStrict) {
  EXPECT_TRUE(CheckStrict("01001000"));
  EXPECT_TRUE(CheckStrict("0100100001101001"));
  EXPECT_TRUE(CheckStrict("0100 1000"));
  EXPECT_FALSE(CheckStrict("0100100"));
  EXPECT_FALSE(CheckStrict("01001000x"));
  EXPECT_FALSE(CheckStrict(""));
  EXPECT_FALSE(CheckStrict("   "));
}

TEST(Bin, CheckAcceptsUnicodeWhiteSpaces) {
  EXPECT_TRUE(Check("0100\xC2\xA0"
                    "1000"));
  // thin space U+2009 and line separator U+2028
  EXPECT_TRUE(CheckStrict("0100\xE2\x80\x89"
                          "1000\xE2\x80\xA8"));
  EXPECT_FALSE(CheckStrict("0100\xC2\xA0"
                           "100"));
  // overlong encoding of a space
  EXPECT_FALSE(Check("0100\xC0\xA0"
                     "1000"));
}

TEST(Bin, Format) {
  EXPECT_EQ(Format("0100100001101001"), "01001000 01101001");
  EXPECT_EQ(Format("01001000xyz01101001"), "01001000 01101001");
  EXPECT_EQ(Format("01001000xyz01100101...01101100   0110110001101111"),
            "01001000 01100101 01101100 01101100 01101111");
}

TEST(Bin, FormatInvalidLength) {
  EXPECT_THROW(Format("0100100"), codec_error);
  EXPECT_THROW(Format(""), codec_error);
}

TEST(Bin, HistoricalNames) {
  EXPECT_EQ(StrToBin("Hi"), "01001000 01101001");
  EXPECT_EQ(BinToStr("01001000 01101001"), "Hi");
  EXPECT_TRUE(IsValidBin("0100 1000"));
  EXPECT_FALSE(IsValidBinStrict("0100100"));
  EXPECT_EQ(FmtBin("0100100001101001"), "01001000 01101001");
}

TEST(Bin, RoundTrip) {
  for (std::string_view text : {"Hello, World!", "a", "\n\t ", "Привет", "日本語 テキスト", "😀 emoji"}) {
    EXPECT_EQ(Decode(Encode(text)), text);
  }
}

}  // namespace sysx::bin

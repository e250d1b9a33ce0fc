#include "image.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "file.hpp"
#include "sysx_exception.hpp"

namespace sysx {

namespace {
using namespace std::string_view_literals;

Image Decode(std::string_view data) { return DecodeImage(std::span<const char>(data.data(), data.size())); }

// 2x1 pixels 24 bits BMP, first pixel is (R=1, G=2, B=3), second one (R=4, G=5, B=6)
constexpr std::string_view kBmp2x1 =
    "BM\x3e\x00\x00\x00\x00\x00\x00\x00\x36\x00\x00\x00"
    "\x28\x00\x00\x00\x02\x00\x00\x00\x01\x00\x00\x00\x01\x00\x18\x00"
    "\x00\x00\x00\x00\x08\x00\x00\x00\x00\x00\x00\x00\x00\x00\x00\x00"
    "\x00\x00\x00\x00\x00\x00\x00\x00"
    "\x03\x02\x01\x06\x05\x04\x00\x00"sv;
}  // namespace

TEST(Image, GrayPgm) {
  const Image image = Decode("P5\n3 2\n255\n\x00\x10\x20\x30\x40\xff"sv);
  EXPECT_EQ(image.width, 3U);
  EXPECT_EQ(image.height, 2U);
  EXPECT_EQ(image.nbChannels, 1U);
  EXPECT_EQ(image.samples, (std::vector<uint8_t>{0x00, 0x10, 0x20, 0x30, 0x40, 0xff}));
  EXPECT_EQ(image.pixel(2, 1)[0], 0xff);
  EXPECT_EQ(image.pixel(0, 1)[0], 0x30);
}

TEST(Image, ColorPpm) {
  const Image image = Decode("P6\n2 1\n255\n\x01\x02\x03\x04\x05\x06"sv);
  EXPECT_EQ(image.width, 2U);
  EXPECT_EQ(image.height, 1U);
  EXPECT_EQ(image.nbChannels, 3U);
  const auto pixel = image.pixel(1, 0);
  EXPECT_EQ(pixel.size(), 3U);
  EXPECT_EQ(pixel[0], 4);
  EXPECT_EQ(pixel[2], 6);
}

TEST(Image, Bmp) {
  const Image image = Decode(kBmp2x1);
  EXPECT_EQ(image.width, 2U);
  EXPECT_EQ(image.height, 1U);
  EXPECT_EQ(image.nbChannels, 3U);
  EXPECT_EQ(image.samples, (std::vector<uint8_t>{1, 2, 3, 4, 5, 6}));
}

TEST(Image, Invalid) {
  EXPECT_THROW(Decode(""sv), exception);
  EXPECT_THROW(Decode("P2\n1 1\n255\n0"sv), exception);
  EXPECT_THROW(Decode("definitely not an image"sv), exception);
}

TEST(Image, ReadFile) {
  const auto filePath =
      std::filesystem::temp_directory_path() / ("sysx_image_test_" + std::to_string(::getpid()) + ".bmp");
  File file(filePath);
  file.write(kBmp2x1);
  const Image image = ReadImage(filePath);
  file.remove();
  EXPECT_EQ(image.pixel(0, 0)[1], 2);

  EXPECT_THROW(ReadImage(filePath), exception);
}

}  // namespace sysx

#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>

#include "image.hpp"
#include "sysx_string.hpp"

namespace sysx {

/// Characters ordered from the darkest to the brightest pixel.
inline constexpr std::string_view kCharSetVeryDetailed =
    "@QB#NgWM8RDHdOKq9$6khEPXwmeZaoS2yjufF]}{tx1zv7lciL/\\|?*>r^;:_\"~,'.-` ";
inline constexpr std::string_view kCharSetDetailed =
    "$@B%8&WM#*oahkbdpqwmZO0QLCJUYXzcvunxrjft/\\|()1{}[]?-_+~<>i!lI;:,\"^ ";
inline constexpr std::string_view kCharSetMedium = "@%#*+=-:;,.~ ";
inline constexpr std::string_view kCharSetSimple = "@#*+:. ";

enum class ResizeFilter : int8_t { kNearest, kBox };

struct AsciiArtConfig {
  uint32_t width{100};
  uint32_t height{50};
  float aspectRatioCompensation{2.0F};  // terminal characters are about twice as high as wide
  ResizeFilter resizeFilter{ResizeFilter::kBox};
  string charSet{kCharSetDetailed};
};

/// Brightness in [0, 1] of a pixel. Luminance of the first three channels for color pixels, gray level otherwise.
float PixelBrightness(std::span<const uint8_t> channels);

/// Resample 'image' to exactly 'width' x 'height' pixels.
Image ResizeImage(const Image &image, uint32_t width, uint32_t height, ResizeFilter resizeFilter);

/// Render 'image' as lines of characters of 'config.charSet', each line ending with '\n'.
/// Throws invalid_argument if the character set is empty or a dimension is zero.
string ImageToAscii(const Image &image, const AsciiArtConfig &config = AsciiArtConfig());

string ImageFileToAscii(const std::filesystem::path &path, const AsciiArtConfig &config = AsciiArtConfig());

string ImageFileToAscii(const std::filesystem::path &path, uint32_t width, uint32_t height,
                        std::string_view charSet);

}  // namespace sysx

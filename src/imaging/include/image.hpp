#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace sysx {

/// 8 bits per sample image, samples stored row by row, channels interleaved.
struct Image {
  /// Samples of pixel at column 'x' and row 'y'.
  std::span<const uint8_t> pixel(uint32_t x, uint32_t y) const {
    return {samples.data() + (static_cast<std::size_t>(y) * width + x) * nbChannels, nbChannels};
  }

  bool empty() const noexcept { return width == 0 || height == 0; }

  uint32_t width{};
  uint32_t height{};
  uint8_t nbChannels{};  // 1: gray, 2: gray + alpha, 3: RGB, 4: RGBA
  std::vector<uint8_t> samples;
};

/// Load an image file in any format decoded by stb_image (PNG, JPEG, BMP, GIF, TGA, PSD, HDR, PIC, PGM / PPM).
/// Throws sysx::exception if the file cannot be read or decoded.
Image ReadImage(const std::filesystem::path &path);

/// Same as ReadImage, from the encoded file content.
Image DecodeImage(std::span<const char> data);

}  // namespace sysx

#include "ascii-art.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <utility>

#include "image.hpp"
#include "sysx_invalid_argument_exception.hpp"
#include "sysx_log.hpp"
#include "sysx_string.hpp"

namespace sysx {

namespace {
// Source range [beg, end) covered by destination index 'dstIdx', never empty.
std::pair<uint32_t, uint32_t> SourceRange(uint32_t dstIdx, uint32_t dstSize, uint32_t srcSize) {
  const auto beg = static_cast<uint32_t>(static_cast<uint64_t>(dstIdx) * srcSize / dstSize);
  const auto end = static_cast<uint32_t>((static_cast<uint64_t>(dstIdx + 1U) * srcSize + dstSize - 1U) / dstSize);
  return {std::min(beg, srcSize - 1U), std::clamp(end, beg + 1U, srcSize)};
}
}  // namespace

float PixelBrightness(std::span<const uint8_t> channels) {
  if (channels.empty()) {
    return 0;
  }
  if (channels.size() >= 3U) {
    // luminance weights in thousandths, so that a white pixel is exactly 1
    const uint32_t weightedSum = 299U * channels[0] + 587U * channels[1] + 114U * channels[2];
    return std::min(static_cast<float>(weightedSum) / (1000.0F * 255.0F), 1.0F);
  }
  return static_cast<float>(channels[0]) / 255.0F;
}

Image ResizeImage(const Image &image, uint32_t width, uint32_t height, ResizeFilter resizeFilter) {
  if (image.empty()) {
    throw invalid_argument("Cannot resize an empty image");
  }
  if (width == 0 || height == 0) {
    throw invalid_argument("Invalid resize dimensions {}x{}", width, height);
  }

  Image resized{width, height, image.nbChannels, {}};
  resized.samples.reserve(static_cast<std::size_t>(width) * height * image.nbChannels);

  for (uint32_t y = 0; y < height; ++y) {
    const auto [begY, endY] = SourceRange(y, height, image.height);
    for (uint32_t x = 0; x < width; ++x) {
      const auto [begX, endX] = SourceRange(x, width, image.width);
      switch (resizeFilter) {
        case ResizeFilter::kNearest: {
          const auto pixel = image.pixel((begX + endX - 1U) / 2U, (begY + endY - 1U) / 2U);
          resized.samples.insert(resized.samples.end(), pixel.begin(), pixel.end());
          break;
        }
        case ResizeFilter::kBox: {
          for (uint8_t channel = 0; channel < image.nbChannels; ++channel) {
            uint64_t sum = 0;
            for (uint32_t srcY = begY; srcY < endY; ++srcY) {
              for (uint32_t srcX = begX; srcX < endX; ++srcX) {
                sum += image.pixel(srcX, srcY)[channel];
              }
            }
            const uint64_t nbPixels = static_cast<uint64_t>(endX - begX) * (endY - begY);
            resized.samples.push_back(static_cast<uint8_t>((sum + nbPixels / 2U) / nbPixels));
          }
          break;
        }
      }
    }
  }
  return resized;
}

string ImageToAscii(const Image &image, const AsciiArtConfig &config) {
  if (config.charSet.empty()) {
    throw invalid_argument("ASCII conversion requires a non empty character set");
  }
  if (image.empty()) {
    throw invalid_argument("Cannot convert an empty image to ASCII");
  }
  if (config.width == 0 || config.height == 0) {
    throw invalid_argument("Invalid ASCII art dimensions {}x{}", config.width, config.height);
  }
  if (!(config.aspectRatioCompensation > 0)) {
    throw invalid_argument("Invalid aspect ratio compensation {}", config.aspectRatioCompensation);
  }

  const double aspectRatio = static_cast<double>(image.width) / static_cast<double>(image.height);
  const double calculatedHeight =
      static_cast<double>(config.width) / aspectRatio / static_cast<double>(config.aspectRatioCompensation);
  const uint32_t scaledWidth = config.width;
  // clamp before the conversion, a tiny compensation gives a height out of uint32_t range
  const auto scaledHeight =
      static_cast<uint32_t>(std::clamp(calculatedHeight, 1.0, static_cast<double>(config.height)));

  log::debug("ASCII art of {}x{} (computed height {})", scaledWidth, scaledHeight, calculatedHeight);

  const Image resized = ResizeImage(image, scaledWidth, scaledHeight, config.resizeFilter);

  const auto nbChars = config.charSet.size();
  string ret;
  ret.reserve(static_cast<std::size_t>(scaledWidth + 1U) * scaledHeight);
  for (uint32_t y = 0; y < scaledHeight; ++y) {
    for (uint32_t x = 0; x < scaledWidth; ++x) {
      const float brightness = PixelBrightness(resized.pixel(x, y));
      const auto charIdx =
          std::min(static_cast<std::size_t>(brightness * static_cast<float>(nbChars - 1U)), nbChars - 1U);
      ret.push_back(config.charSet[charIdx]);
    }
    ret.push_back('\n');
  }
  return ret;
}

string ImageFileToAscii(const std::filesystem::path &path, const AsciiArtConfig &config) {
  return ImageToAscii(ReadImage(path), config);
}

string ImageFileToAscii(const std::filesystem::path &path, uint32_t width, uint32_t height,
                        std::string_view charSet) {
  if (charSet.empty()) {
    throw invalid_argument("ASCII conversion requires a non empty character set");
  }
  AsciiArtConfig config;
  config.width = width;
  config.height = height;
  config.charSet = charSet;
  return ImageFileToAscii(path, config);
}

}  // namespace sysx

#include "image.hpp"

#include <climits>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>

#ifdef SYSX_STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_IMPLEMENTATION
#endif
#include <stb_image.h>

#include "file.hpp"
#include "sysx_exception.hpp"
#include "sysx_log.hpp"
#include "sysx_string.hpp"

namespace sysx {

namespace {
using StbiPixels = std::unique_ptr<stbi_uc, decltype(&stbi_image_free)>;

const char *FailureReason() {
  const char *reason = stbi_failure_reason();
  return reason == nullptr ? "unknown" : reason;
}
}  // namespace

Image DecodeImage(std::span<const char> data) {
  if (data.empty()) {
    throw exception("Cannot decode an empty image");
  }
  if (data.size() > static_cast<std::size_t>(INT_MAX)) {
    throw exception("Image of {} bytes is too large", data.size());
  }

  int width = 0;
  int height = 0;
  int nbChannels = 0;
  StbiPixels pixels(stbi_load_from_memory(reinterpret_cast<const stbi_uc *>(data.data()), static_cast<int>(data.size()),
                                          &width, &height, &nbChannels, 0),
                    &stbi_image_free);
  if (!pixels) {
    throw exception("Unable to decode image: {}", FailureReason());
  }

  Image image;
  image.width = static_cast<uint32_t>(width);
  image.height = static_cast<uint32_t>(height);
  image.nbChannels = static_cast<uint8_t>(nbChannels);

  const std::size_t nbSamples = static_cast<std::size_t>(image.width) * image.height * image.nbChannels;
  image.samples.assign(pixels.get(), pixels.get() + nbSamples);
  return image;
}

Image ReadImage(const std::filesystem::path &path) {
  const string data = File(path).readAll();
  Image image = DecodeImage(data);
  log::debug("Loaded image {} of {}x{} with {} channel(s)", path.string(), image.width, image.height,
             image.nbChannels);
  return image;
}

}  // namespace sysx

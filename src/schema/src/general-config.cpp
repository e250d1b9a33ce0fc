#include "general-config.hpp"

#include <filesystem>

#include "ascii-art.hpp"
#include "file.hpp"
#include "read-json.hpp"
#include "sysx_invalid_argument_exception.hpp"

namespace sysx {

namespace schema {

::sysx::AsciiArtConfig AsciiArtConfig::toAsciiArtConfig() const {
  ::sysx::AsciiArtConfig config;
  config.width = width;
  config.height = height;
  config.aspectRatioCompensation = aspectRatioCompensation;
  if (resizeFilter == "box") {
    config.resizeFilter = ResizeFilter::kBox;
  } else if (resizeFilter == "nearest") {
    config.resizeFilter = ResizeFilter::kNearest;
  } else {
    throw invalid_argument("Unknown resize filter '{}', expected box or nearest", resizeFilter);
  }
  config.charSet = charSet;
  return config;
}

}  // namespace schema

schema::GeneralConfig ReadGeneralConfig(const std::filesystem::path &path) {
  return ReadJsonOrCreateFile<schema::GeneralConfig>(File{path, File::IfError::kNoThrow});
}

}  // namespace sysx

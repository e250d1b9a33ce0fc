#pragma once

#include <cstdint>
#include <filesystem>

#include "ascii-art.hpp"
#include "log-config.hpp"
#include "sysx_string.hpp"

namespace sysx {

namespace schema {

struct AsciiArtConfig {
  /// Convert to the rendering settings, throwing invalid_argument for an unknown resize filter.
  ::sysx::AsciiArtConfig toAsciiArtConfig() const;

  uint32_t width{::sysx::AsciiArtConfig{}.width};
  uint32_t height{::sysx::AsciiArtConfig{}.height};
  float aspectRatioCompensation{::sysx::AsciiArtConfig{}.aspectRatioCompensation};
  string resizeFilter{"box"};  // box | nearest
  string charSet{kCharSetDetailed};
};

struct GeneralConfig {
  LogConfig log;
  AsciiArtConfig asciiArt;
};

}  // namespace schema

/// Read the general configuration from the json file at 'path', creating it with default values if it does not exist.
schema::GeneralConfig ReadGeneralConfig(const std::filesystem::path &path);

}  // namespace sysx

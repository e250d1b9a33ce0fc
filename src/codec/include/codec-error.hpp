#pragma once

#include <cstdint>
#include <string_view>
#include <utility>

#include "sysx_exception.hpp"
#include "sysx_format.hpp"

namespace sysx {

enum class CodecErrc : int8_t {
  kEmptyInput,        // no digit left after cleaning, whereas at least one byte is required
  kMisalignedLength,  // number of digits is not a multiple of the number of digits per byte
  kInvalidUtf8,       // decoded bytes are not valid UTF-8
  kParseInt,          // a group of digits could not be parsed as a byte
};

std::string_view CodecErrcName(CodecErrc errc);

/// Error raised by the radix codecs on malformed input.
/// All kinds but kParseInt are syntax errors.
class codec_error : public exception {
 public:
  template <typename... Args>
  codec_error(CodecErrc errc, format_string<Args...> fmt, Args &&...args)
      : exception(fmt, std::forward<Args>(args)...), _errc(errc) {}

  CodecErrc errc() const noexcept { return _errc; }

  bool isInvalidSyntax() const noexcept { return _errc != CodecErrc::kParseInt; }

  bool isParseInt() const noexcept { return _errc == CodecErrc::kParseInt; }

 private:
  CodecErrc _errc;
};

}  // namespace sysx

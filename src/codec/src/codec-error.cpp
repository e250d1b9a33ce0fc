#include "codec-error.hpp"

#include <string_view>

#include "unreachable.hpp"

namespace sysx {

std::string_view CodecErrcName(CodecErrc errc) {
  switch (errc) {
    case CodecErrc::kEmptyInput:
      return "empty input";
    case CodecErrc::kMisalignedLength:
      return "misaligned length";
    case CodecErrc::kInvalidUtf8:
      return "invalid UTF-8";
    case CodecErrc::kParseInt:
      return "integer parsing";
    default:
      unreachable();
  }
}

}  // namespace sysx

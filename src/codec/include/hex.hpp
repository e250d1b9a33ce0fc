#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "radix-codec.hpp"
#include "sysx_string.hpp"

namespace sysx::hex {

inline string Clean(std::string_view input) { return HexCodec::Clean(input); }

inline string Decode(std::string_view hex) { return HexCodec::Decode(hex); }

inline std::vector<uint8_t> DecodeBytes(std::string_view hex) { return HexCodec::DecodeBytes(hex); }

inline string Encode(std::string_view text) { return HexCodec::Encode(text); }

inline bool Check(std::string_view hex) noexcept { return HexCodec::Check(hex); }

inline bool CheckStrict(std::string_view hex) noexcept { return HexCodec::CheckStrict(hex); }

inline string Format(std::string_view hex) { return HexCodec::Format(hex); }

// Historical names

inline string HexToStr(std::string_view hex) { return Decode(hex); }

inline string StrToHex(std::string_view text) { return Encode(text); }

inline bool IsValidHex(std::string_view hex) noexcept { return Check(hex); }

inline bool IsValidHexStrict(std::string_view hex) noexcept { return CheckStrict(hex); }

inline string FmtHex(std::string_view hex) { return Format(hex); }

}  // namespace sysx::hex

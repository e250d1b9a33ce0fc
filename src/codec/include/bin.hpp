#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "radix-codec.hpp"
#include "sysx_string.hpp"

namespace sysx::bin {

inline string Clean(std::string_view input) { return BinCodec::Clean(input); }

inline string Decode(std::string_view bin) { return BinCodec::Decode(bin); }

inline std::vector<uint8_t> DecodeBytes(std::string_view bin) { return BinCodec::DecodeBytes(bin); }

inline string Encode(std::string_view text) { return BinCodec::Encode(text); }

inline bool Check(std::string_view bin) noexcept { return BinCodec::Check(bin); }

inline bool CheckStrict(std::string_view bin) noexcept { return BinCodec::CheckStrict(bin); }

inline string Format(std::string_view bin) { return BinCodec::Format(bin); }

// Historical names

inline string BinToStr(std::string_view bin) { return Decode(bin); }

inline string StrToBin(std::string_view text) { return Encode(text); }

inline bool IsValidBin(std::string_view bin) noexcept { return Check(bin); }

inline bool IsValidBinStrict(std::string_view bin) noexcept { return CheckStrict(bin); }

inline string FmtBin(std::string_view bin) { return Format(bin); }

}  // namespace sysx::bin

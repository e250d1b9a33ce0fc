#pragma once

#ifdef SYSX_DISABLE_SPDLOG
#include <fmt/format.h>
#else
#include <spdlog/fmt/fmt.h>
#endif

namespace sysx {

// Formatting does not depend on logging: fmt is used directly when spdlog is disabled.
template <typename... Args>
using format_string = fmt::format_string<Args...>;
using fmt::format;
using fmt::format_to;
using fmt::format_to_n;

}  // namespace sysx

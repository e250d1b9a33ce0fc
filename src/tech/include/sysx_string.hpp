#pragma once

#include <string>

namespace sysx {

using string = std::string;

}  // namespace sysx

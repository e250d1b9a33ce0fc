#include "random.hpp"

#include <algorithm>
#include <cstdint>
#include <random>
#include <string_view>
#include <vector>

#include "sysx_invalid_argument_exception.hpp"
#include "sysx_string.hpp"

namespace sysx {

RandomGenerator::RandomGenerator() : _engine(std::random_device{}()) {}

bool RandomGenerator::randomRatio(uint32_t numerator, uint32_t denominator) {
  if (denominator == 0) {
    throw invalid_argument("Denominator cannot be zero");
  }
  if (numerator >= denominator) {
    return true;
  }
  return std::uniform_int_distribution<uint32_t>(0, denominator - 1)(_engine) < numerator;
}

string RandomGenerator::randomString(std::size_t length, std::string_view charset) {
  if (charset.empty()) {
    throw invalid_argument("Provided charset is empty");
  }
  std::uniform_int_distribution<std::size_t> distribution(0, charset.size() - 1);
  string ret(length, '\0');
  std::ranges::generate(ret, [this, &distribution, charset] { return charset[distribution(_engine)]; });
  return ret;
}

std::vector<uint8_t> RandomGenerator::randomBytes(std::size_t length) {
  // uint8_t is not an allowed type for uniform_int_distribution
  std::uniform_int_distribution<unsigned int> distribution(0, UINT8_MAX);
  std::vector<uint8_t> ret(length);
  std::ranges::generate(ret, [this, &distribution] { return static_cast<uint8_t>(distribution(_engine)); });
  return ret;
}

RandomGenerator &ThreadLocalRandomGenerator() {
  thread_local RandomGenerator generator;
  return generator;
}

}  // namespace sysx

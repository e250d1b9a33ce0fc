#pragma once

#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <random>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "sysx_invalid_argument_exception.hpp"
#include "sysx_string.hpp"

namespace sysx {

/// Wrapper around a 64 bits Mersenne Twister engine offering uniform distributions of common types.
/// Not thread safe - use one generator per thread, or the free functions below that rely on a thread local one.
class RandomGenerator {
 public:
  static constexpr std::string_view kAlphanumericCharset =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

  /// Creates a generator seeded from std::random_device.
  RandomGenerator();

  /// Creates a generator with a fixed seed, for reproducible sequences.
  explicit RandomGenerator(uint64_t seed) : _engine(seed) {}

  /// Returns a random value uniformly distributed in the inclusive range [min, max].
  /// Bounds are swapped if min > max.
  template <class T>
    requires(std::integral<T> && !std::same_as<T, bool>)
  T random(T min, T max) {
    if (min > max) {
      std::swap(min, max);
    }
    // char types are not allowed in uniform_int_distribution
    using WideInt = std::conditional_t<std::is_signed_v<T>, int64_t, uint64_t>;
    return static_cast<T>(
        std::uniform_int_distribution<WideInt>(static_cast<WideInt>(min), static_cast<WideInt>(max))(_engine));
  }

  /// Returns a random value uniformly distributed in [min, max].
  /// Bounds are swapped if min > max. Throws invalid_argument if one of the bounds is not a number.
  template <std::floating_point T>
  T random(T min, T max) {
    if (std::isnan(min) || std::isnan(max)) {
      throw invalid_argument("Invalid range comparison: cannot compare given values");
    }
    if (min > max) {
      std::swap(min, max);
    }
    if (min == max) {
      return min;
    }
    return std::uniform_real_distribution<T>(min, std::nextafter(max, std::numeric_limits<T>::max()))(_engine);
  }

  bool randomBool() { return std::bernoulli_distribution(0.5)(_engine); }

  /// Returns true with probability numerator / denominator.
  /// Throws invalid_argument if denominator is 0.
  bool randomRatio(uint32_t numerator, uint32_t denominator);

  /// Returns a string of given length made of characters picked uniformly from given charset.
  /// Throws invalid_argument if charset is empty.
  string randomString(std::size_t length, std::string_view charset = kAlphanumericCharset);

  std::vector<uint8_t> randomBytes(std::size_t length);

 private:
  std::mt19937_64 _engine;
};

/// Thread local generator used by the free functions below.
RandomGenerator &ThreadLocalRandomGenerator();

template <class T>
T Random(T min, T max) {
  return ThreadLocalRandomGenerator().random(min, max);
}

inline bool RandomBool() { return ThreadLocalRandomGenerator().randomBool(); }

inline bool RandomRatio(uint32_t numerator, uint32_t denominator) {
  return ThreadLocalRandomGenerator().randomRatio(numerator, denominator);
}

inline string RandomString(std::size_t length, std::string_view charset = RandomGenerator::kAlphanumericCharset) {
  return ThreadLocalRandomGenerator().randomString(length, charset);
}

inline std::vector<uint8_t> RandomBytes(std::size_t length) { return ThreadLocalRandomGenerator().randomBytes(length); }

/// Returns a random value in the inclusive range [min, max].
/// Contrary to Random, throws invalid_argument if min > max (or if a bound is not a number).
template <class T>
T RandomRange(T min, T max) {
  if (!(min <= max)) {
    throw invalid_argument("Invalid inclusive range [{}, {}]", min, max);
  }
  return Random(min, max);
}

/// Infinite range of random values uniformly distributed in [min, max], driven by its own generator.
/// Bounds are swapped if min > max. Throws invalid_argument at construction if a bound is not a number.
/// Example:
///   RandomValues dice(1, 6);
///   for (int val : dice | std::views::take(10)) { ... }
template <class T>
class RandomValues {
 public:
  class iterator {
   public:
    using iterator_concept = std::input_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;

    iterator() noexcept = default;

    explicit iterator(RandomValues *randomValues) : _randomValues(randomValues), _value((*randomValues)()) {}

    const T &operator*() const noexcept { return _value; }

    iterator &operator++() {
      _value = (*_randomValues)();
      return *this;
    }

    void operator++(int) { ++*this; }

   private:
    RandomValues *_randomValues{};
    T _value{};
  };

  RandomValues(T min, T max) : RandomValues(RandomGenerator(), min, max) {}

  RandomValues(RandomGenerator generator, T min, T max) : _generator(std::move(generator)), _min(min), _max(max) {
    if constexpr (std::floating_point<T>) {
      if (std::isnan(min) || std::isnan(max)) {
        throw invalid_argument("Invalid range comparison: cannot compare given values");
      }
    }
    if (_max < _min) {
      std::swap(_min, _max);
    }
  }

  /// Next random value.
  T operator()() { return _generator.random(_min, _max); }

  iterator begin() { return iterator(this); }

  static constexpr std::unreachable_sentinel_t end() noexcept { return std::unreachable_sentinel; }

  T min() const noexcept { return _min; }
  T max() const noexcept { return _max; }

 private:
  RandomGenerator _generator;
  T _min;
  T _max;
};

}  // namespace sysx

#pragma once

#include <string_view>

#include "sysx_config.hpp"
#include "sysx_string.hpp"

namespace sysx {

namespace details {
/// Extract the name of 'T' from a pretty function signature of TypeName<T>().
/// Supported formats are:
///  - gcc:   "... TypeName() [with T = int; std::string_view = ...]"
///  - clang: "... TypeName() [T = int]"
constexpr std::string_view ExtractTypeName(std::string_view prettyFunction) {
  constexpr std::string_view kTypeMarker = "T = ";
  auto first = prettyFunction.find(kTypeMarker);
  if (first == std::string_view::npos) {
    return prettyFunction;
  }
  first += kTypeMarker.size();
  auto last = prettyFunction.find(';', first);
  if (last == std::string_view::npos) {
    last = prettyFunction.rfind(']');
  }
  return prettyFunction.substr(first, last - first);
}
}  // namespace details

/// Returns the name of type 'T', as written by the compiler.
/// Exact spelling is compiler dependent, for instance "std::__cxx11::basic_string<char>" for gcc strings.
template <class T>
constexpr std::string_view TypeName() {
  return details::ExtractTypeName(SYSX_PRETTY_FUNCTION);
}

template <class T>
constexpr std::string_view TypeName(const T &) {
  return TypeName<T>();
}

/// Tells whether given type string represents a generic type or a list of types.
/// It is the case if it contains angle brackets, or if it is enclosed by square brackets.
bool IsListLike(std::string_view typeStr);

/// Simplify a non generic type by keeping only its last '::' separated component.
/// Example: "std::string" -> "string"
string SimplifyNonListType(std::string_view typeStr);

/// Simplify a type string by removing all namespace qualifiers, generics included.
/// Top level comma separated types are simplified independently and joined with ", ".
/// Examples:
///   "std::vector<std::string>" -> "vector<string>"
///   "std::map<a::K, b::V>, c::D" -> "map<K, V>, D"
string SimplifyType(std::string_view typeStr);

}  // namespace sysx

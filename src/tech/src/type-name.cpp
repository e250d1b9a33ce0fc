#include "type-name.hpp"

#include <iterator>
#include <regex>
#include <string_view>

#include "stringhelpers.hpp"
#include "sysx_string.hpp"

namespace sysx {

namespace {
const std::regex &QualifierRegex() {
  static const std::regex kQualifierRegex("([a-zA-Z_][a-zA-Z0-9_]*::)+");
  return kQualifierRegex;
}

void AppendSimplifiedToken(std::string_view token, string &out) {
  if (!out.empty()) {
    out.append(", ");
  }
  token = TrimSpaces(token);
  std::regex_replace(std::back_inserter(out), token.begin(), token.end(), QualifierRegex(), "");
}
}  // namespace

bool IsListLike(std::string_view typeStr) {
  if (typeStr.find_first_of("<>") != std::string_view::npos) {
    return true;
  }
  const auto trimmed = TrimSpaces(typeStr);
  return trimmed.starts_with('[') && trimmed.ends_with(']');
}

string SimplifyNonListType(std::string_view typeStr) {
  const auto lastSepPos = typeStr.rfind("::");
  if (lastSepPos == std::string_view::npos) {
    return string(typeStr);
  }
  return string(typeStr.substr(lastSepPos + 2));
}

string SimplifyType(std::string_view typeStr) {
  if (!IsListLike(typeStr)) {
    return SimplifyNonListType(typeStr);
  }

  string ret;
  ret.reserve(typeStr.size());

  int bracketDepth = 0;
  auto tokenFirst = typeStr.begin();
  for (auto it = typeStr.begin(); it != typeStr.end(); ++it) {
    switch (*it) {
      case '<':
        ++bracketDepth;
        break;
      case '>':
        if (bracketDepth > 0) {
          --bracketDepth;
        }
        break;
      case ',':
        if (bracketDepth == 0) {
          AppendSimplifiedToken(std::string_view(tokenFirst, it), ret);
          tokenFirst = it + 1;
        }
        break;
      default:
        break;
    }
  }
  if (tokenFirst != typeStr.end()) {
    AppendSimplifiedToken(std::string_view(tokenFirst, typeStr.end()), ret);
  }

  return ret;
}

}  // namespace sysx

#pragma once

#include <string>
#include <string_view>

#include "trellis/ascii.hpp"

namespace trellis::url {

/// Characters left untouched by URI component encoding (RFC 3986 unreserved set plus the sub-delimiters
/// "!*'()" that browsers keep as is).
constexpr bool IsComponentSafe(char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || IsAsciiDigit(ch) || ch == '-' || ch == '_' ||
         ch == '.' || ch == '!' || ch == '~' || ch == '*' || ch == '\'' || ch == '(' || ch == ')';
}

/// Percent-encodes a URI component (cookie names and values, path segments). Escapes use upper case hexadecimal.
inline std::string EncodeComponent(std::string_view data) {
  std::string ret;
  ret.reserve(data.size());
  for (const char ch : data) {
    if (IsComponentSafe(ch)) {
      ret.push_back(ch);
      continue;
    }
    const auto byte = static_cast<unsigned char>(ch);
    ret.push_back('%');
    ret.push_back(HexDigit(byte >> 4U));
    ret.push_back(HexDigit(byte));
  }
  return ret;
}

/// Percent-encodes each '/' separated segment of a relative or absolute path, the separators are kept.
inline std::string EncodePath(std::string_view path) {
  std::string ret;
  ret.reserve(path.size());
  while (true) {
    const auto slashPos = path.find('/');
    ret.append(EncodeComponent(path.substr(0, slashPos)));
    if (slashPos == std::string_view::npos) {
      break;
    }
    ret.push_back('/');
    path.remove_prefix(slashPos + 1);
  }
  return ret;
}

}  // namespace trellis::url

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace trellis {

// Locale independent ASCII helpers for protocol tokens (header names, media types, units, hex escapes).

constexpr char AsciiLower(char ch) noexcept {
  return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch + ('a' - 'A')) : ch;
}

constexpr bool IsAsciiDigit(char ch) noexcept { return ch >= '0' && ch <= '9'; }

// Value of an hexadecimal digit (either case), -1 for any other char.
constexpr int HexValue(char ch) noexcept {
  if (IsAsciiDigit(ch)) {
    return ch - '0';
  }
  const char lower = AsciiLower(ch);
  if (lower >= 'a' && lower <= 'f') {
    return lower - 'a' + 10;
  }
  return -1;
}

// Upper case hexadecimal digit of the low 4 bits of 'nibble'.
constexpr char HexDigit(unsigned nibble) noexcept { return "0123456789ABCDEF"[nibble & 0x0FU]; }

constexpr bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (AsciiLower(lhs[pos]) != AsciiLower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

constexpr bool StartsWithIgnoreCase(std::string_view value, std::string_view prefix) noexcept {
  return value.size() >= prefix.size() && EqualsIgnoreCase(value.substr(0, prefix.size()), prefix);
}

inline std::string AsciiLowerCopy(std::string_view str) {
  std::string ret(str.size(), '\0');
  for (std::size_t pos = 0; pos < str.size(); ++pos) {
    ret[pos] = AsciiLower(str[pos]);
  }
  return ret;
}

// Removes leading and trailing optional whitespace (SP and HTAB, RFC 9110 OWS).
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  const auto first = sv.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  return sv.substr(first, sv.find_last_not_of(" \t") - first + 1);
}

}  // namespace trellis

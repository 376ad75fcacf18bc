#include "trellis/url-decode.hpp"

#include <optional>
#include <string>
#include <string_view>

#include "trellis/ascii.hpp"

namespace trellis::url {

char* DecodeInPlace(char* first, const char* last, char plusAs, bool strictInvalid) {
  char* out = first;
  for (; first < last; ++first) {
    const char ch = *first;
    if (ch == '+') {
      *out++ = plusAs;
      continue;
    }
    if (ch != '%') {
      *out++ = ch;
      continue;
    }
    if (last - first < 3) {
      if (strictInvalid) {
        return nullptr;
      }
      *out++ = '%';
      continue;
    }
    const int hi = HexValue(first[1]);
    const int lo = HexValue(first[2]);
    if (hi < 0 || lo < 0) {
      if (strictInvalid) {
        return nullptr;
      }
      *out++ = '%';
      continue;
    }
    *out++ = static_cast<char>((hi << 4) | lo);
    first += 2;
  }
  return out;
}

std::optional<std::string> DecodeComponent(std::string_view component) {
  std::string ret(component);
  char* newEnd = DecodeInPlace(ret.data(), ret.data() + ret.size(), '+', true);
  if (newEnd == nullptr) {
    return std::nullopt;
  }
  ret.resize(static_cast<std::string::size_type>(newEnd - ret.data()));
  return ret;
}

}  // namespace trellis::url

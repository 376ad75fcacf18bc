#include "trellis/byte-range.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <optional>
#include <string_view>
#include <system_error>

#include "trellis/ascii.hpp"
#include "trellis/vector.hpp"

namespace trellis {

namespace {

constexpr bool IsSpace(char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '\f'; }

constexpr std::string_view TrimSpaces(std::string_view sv) {
  while (!sv.empty() && IsSpace(sv.front())) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && IsSpace(sv.back())) {
    sv.remove_suffix(1);
  }
  return sv;
}

// Parses a non empty run of decimal digits (and nothing else). Returns false on other chars or overflow.
bool ParseDigits(std::string_view digits, std::size_t& out) {
  if (digits.empty()) {
    return false;
  }
  const char* end = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(digits.data(), end, out);
  return ec == std::errc() && ptr == end;
}

// One range-spec "first-last" / "first-" / "-suffix", spaces allowed around each token.
std::optional<ByteRange> InterpretRange(std::string_view rangeSpec, std::size_t size) {
  const auto dashPos = rangeSpec.find('-');
  if (dashPos == std::string_view::npos) {
    return std::nullopt;
  }
  const std::string_view firstStr = TrimSpaces(rangeSpec.substr(0, dashPos));
  const std::string_view lastStr = TrimSpaces(rangeSpec.substr(dashPos + 1));
  if (firstStr.empty() && lastStr.empty()) {
    return std::nullopt;
  }

  std::size_t first = 0;
  std::size_t last = 0;
  if (firstStr.empty()) {
    if (!ParseDigits(lastStr, last)) {
      return std::nullopt;
    }
    return ByteRange{size - std::min(last, size), size};
  }
  if (!ParseDigits(firstStr, first)) {
    return std::nullopt;
  }
  if (lastStr.empty()) {
    return ByteRange{first, size};
  }
  if (!ParseDigits(lastStr, last) || last < first || last == static_cast<std::size_t>(-1)) {
    return std::nullopt;
  }
  return ByteRange{first, last + 1};
}

// Consumes the "bytes" unit and the '=' (spaces allowed around both), returns the range-spec list or std::nullopt.
std::optional<std::string_view> StripBytesUnit(std::string_view header) {
  header = TrimSpaces(header);
  static constexpr std::string_view kUnit = "bytes";
  if (header.size() < kUnit.size()) {
    return std::nullopt;
  }
  for (std::size_t pos = 0; pos < kUnit.size(); ++pos) {
    if (AsciiLower(header[pos]) != kUnit[pos]) {
      return std::nullopt;
    }
  }
  header = TrimSpaces(header.substr(kUnit.size()));
  if (!header.starts_with('=')) {
    return std::nullopt;
  }
  return header.substr(1);
}

// Syntax of one range-spec: optional digits, '-', optional digits, with spaces allowed around each token.
bool IsWellFormedRangeSpec(std::string_view rangeSpec) {
  const auto dashPos = rangeSpec.find('-');
  if (dashPos == std::string_view::npos) {
    return false;
  }
  const auto isDigitsOnly = [](std::string_view token) {
    return std::ranges::all_of(TrimSpaces(token), [](char ch) { return ch >= '0' && ch <= '9'; });
  };
  return isDigitsOnly(rangeSpec.substr(0, dashPos)) && isDigitsOnly(rangeSpec.substr(dashPos + 1));
}

}  // namespace

std::optional<ByteRange> InterpretFirstRange(std::string_view header, std::size_t resourceSize) {
  const auto rangeSpecList = StripBytesUnit(header);
  if (!rangeSpecList) {
    return std::nullopt;
  }

  SmallVector<std::string_view, 4> rangeSpecs;
  for (std::string_view remaining = *rangeSpecList;;) {
    const auto commaPos = remaining.find(',');
    const std::string_view rangeSpec = remaining.substr(0, commaPos);
    if (!IsWellFormedRangeSpec(rangeSpec)) {
      return std::nullopt;
    }
    rangeSpecs.push_back(rangeSpec);
    if (commaPos == std::string_view::npos) {
      break;
    }
    remaining.remove_prefix(commaPos + 1);
  }

  std::optional<ByteRange> merged = InterpretRange(rangeSpecs.front(), resourceSize);
  if (!merged) {
    return std::nullopt;
  }
  for (auto it = rangeSpecs.begin() + 1; it != rangeSpecs.end(); ++it) {
    const auto next = InterpretRange(*it, resourceSize);
    if (!next || next->begin > merged->end) {
      break;
    }
    merged->end = std::max(merged->end, next->end);
  }
  return merged;
}

}  // namespace trellis

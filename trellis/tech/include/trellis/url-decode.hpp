#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace trellis::url {

/// In-place percent decoding of [first, last). '+' is replaced by 'plusAs'.
/// When 'strictInvalid' is true, a malformed escape makes the function return nullptr, otherwise malformed escapes
/// are kept literally. Returns the new end of the decoded range.
char* DecodeInPlace(char* first, const char* last, char plusAs, bool strictInvalid);

/// Strict decoding of a URI component ('+' is kept as is). Returns std::nullopt on malformed escapes.
std::optional<std::string> DecodeComponent(std::string_view component);

}  // namespace trellis::url

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace trellis {

/// Half-open byte interval [begin, end) of a resource.
struct ByteRange {
  std::size_t begin{};
  std::size_t end{};

  [[nodiscard]] constexpr std::size_t length() const noexcept { return end > begin ? end - begin : 0; }

  bool operator==(const ByteRange&) const noexcept = default;
};

/// Interprets an HTTP 'Range' header value ("bytes=<range-spec>(,<range-spec>)*") against a resource of
/// 'resourceSize' bytes. Each range-spec is one of "first-last" ([first, last + 1)), "first-" ([first, size)) or
/// "-suffix" ([size - suffix, size), the beginning being clamped at 0).
/// Consecutive range-specs are merged into the first one as long as they start at or before the end of the merged
/// range, the first gap stops the merge: only the first continuous run is returned.
/// Returns std::nullopt for a malformed header (no "bytes=" unit, empty range-spec, "last" before "first", overflow),
/// in which case the caller should serve the full content. The result is not checked against 'resourceSize'.
std::optional<ByteRange> InterpretFirstRange(std::string_view header, std::size_t resourceSize);

}  // namespace trellis

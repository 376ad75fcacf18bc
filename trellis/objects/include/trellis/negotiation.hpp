#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "trellis/vector.hpp"

namespace trellis {

/// Dimension along which a request and an application negotiate.
enum class NegotiationKind : uint8_t {
  MediaType,  // 'accept', "type/subtype" with '*' wildcards
  Language,   // 'accept-language', RFC 4647 basic filtering ("en" matches "en-US")
  Charset,    // 'accept-charset'
  Encoding,   // 'accept-encoding'
  Host,       // 'host' + server port, the candidate side carries the wildcards
};

/// One element of a weighted preference list ("text/html;q=0.8").
struct QualityEntry {
  std::string_view value;
  double quality{1.0};
};

using QualityList = SmallVector<QualityEntry, 8>;

/// Splits a comma separated preference header into its entries. Parameters other than 'q' are dropped, invalid
/// q-values count as 0 and valid ones are clamped to [0, 1]. Empty elements are skipped.
QualityList ParseQualityList(std::string_view header);

/// Returns the index of the candidate that best satisfies 'header', std::nullopt if no candidate is acceptable.
/// Each candidate takes the quality of the most specific header entry matching it, candidates with a null quality
/// are rejected, the highest quality wins and ties are resolved in favor of the earliest candidate.
/// An empty header is treated as "*".
/// For NegotiationKind::Host, 'header' is the request host ("name:port") and candidates are "*", "name" (any port)
/// or "name:port".
std::optional<std::size_t> BestMatch(std::span<const std::string_view> candidates, std::string_view header,
                                     NegotiationKind kind);

}  // namespace trellis

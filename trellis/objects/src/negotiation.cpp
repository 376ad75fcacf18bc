#include "trellis/negotiation.hpp"

#include <charconv>
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <system_error>

#include "trellis/ascii.hpp"

namespace trellis {

namespace {

// Parse q-value within the parameters of an entry; never throws.
double ParseQ(std::string_view params) {
  while (!params.empty()) {
    const auto nextSemi = params.find(';');
    const std::string_view param = TrimOws(params.substr(0, nextSemi));
    params = nextSemi == std::string_view::npos ? std::string_view{} : params.substr(nextSemi + 1);

    if (param.size() < 2 || (param[0] != 'q' && param[0] != 'Q') || param[1] != '=') {
      continue;
    }
    const std::string_view val = TrimOws(param.substr(2));
    if (val.empty()) {
      return 0.0;
    }
    double qualityValue = 0.0;
    const char* end = val.data() + val.size();
    const auto [ptr, ec] = std::from_chars(val.data(), end, qualityValue);
    if (ec != std::errc() || ptr != end) {
      return 0.0;
    }
    if (qualityValue < 0.0) {
      return 0.0;
    }
    return qualityValue > 1.0 ? 1.0 : qualityValue;
  }
  return 1.0;
}

struct MediaType {
  std::string_view type;
  std::string_view subtype;
};

MediaType SplitMediaType(std::string_view value) {
  if (value == "*") {
    return {"*", "*"};
  }
  const auto slashPos = value.find('/');
  if (slashPos == std::string_view::npos) {
    return {value, "*"};
  }
  return {TrimOws(value.substr(0, slashPos)), TrimOws(value.substr(slashPos + 1))};
}

// Specificity of 'range' (header side) against 'candidate', -1 when it does not match.
int Specificity(std::string_view range, std::string_view candidate, NegotiationKind kind) {
  if (kind == NegotiationKind::MediaType) {
    const MediaType rangeType = SplitMediaType(range);
    const MediaType candidateType = SplitMediaType(candidate);
    const bool typeExact = EqualsIgnoreCase(rangeType.type, candidateType.type);
    const bool subtypeExact = EqualsIgnoreCase(rangeType.subtype, candidateType.subtype);
    if ((!typeExact && rangeType.type != "*") || (!subtypeExact && rangeType.subtype != "*")) {
      return -1;
    }
    return (typeExact ? 2 : 0) + (subtypeExact ? 1 : 0);
  }
  if (range == "*") {
    return 0;
  }
  if (EqualsIgnoreCase(range, candidate)) {
    return 1 + static_cast<int>(range.size());
  }
  if (kind == NegotiationKind::Language && candidate.size() > range.size() && candidate[range.size()] == '-' &&
      StartsWithIgnoreCase(candidate, range)) {
    return static_cast<int>(range.size());
  }
  return -1;
}

double CandidateQuality(const QualityList& entries, std::string_view candidate, NegotiationKind kind) {
  int bestSpecificity = -1;
  double quality = 0.0;
  for (const QualityEntry& entry : entries) {
    const int specificity = Specificity(entry.value, candidate, kind);
    if (specificity > bestSpecificity) {
      bestSpecificity = specificity;
      quality = entry.quality;
    }
  }
  return quality;
}

bool HostMatches(std::string_view candidate, std::string_view host) {
  if (candidate == "*" || EqualsIgnoreCase(candidate, host)) {
    return true;
  }
  if (candidate.find(':') != std::string_view::npos) {
    return false;
  }
  const auto colonPos = host.rfind(':');
  return colonPos != std::string_view::npos && EqualsIgnoreCase(candidate, host.substr(0, colonPos));
}

}  // namespace

QualityList ParseQualityList(std::string_view header) {
  QualityList entries;
  while (!header.empty()) {
    const auto commaPos = header.find(',');
    const std::string_view element = header.substr(0, commaPos);
    header = commaPos == std::string_view::npos ? std::string_view{} : header.substr(commaPos + 1);

    const auto semiPos = element.find(';');
    const std::string_view value = TrimOws(element.substr(0, semiPos));
    if (value.empty()) {
      continue;
    }
    const double quality = semiPos == std::string_view::npos ? 1.0 : ParseQ(element.substr(semiPos + 1));
    entries.push_back(QualityEntry{value, quality});
  }
  return entries;
}

std::optional<std::size_t> BestMatch(std::span<const std::string_view> candidates, std::string_view header,
                                     NegotiationKind kind) {
  if (kind == NegotiationKind::Host) {
    for (std::size_t pos = 0; pos < candidates.size(); ++pos) {
      if (HostMatches(candidates[pos], header)) {
        return pos;
      }
    }
    return std::nullopt;
  }

  QualityList entries = ParseQualityList(header);
  if (entries.empty()) {
    entries.push_back(QualityEntry{"*", 1.0});
  }

  std::optional<std::size_t> best;
  double bestQuality = 0.0;
  for (std::size_t pos = 0; pos < candidates.size(); ++pos) {
    const double quality = CandidateQuality(entries, candidates[pos], kind);
    if (quality > bestQuality) {
      bestQuality = quality;
      best = pos;
    }
  }
  return best;
}

}  // namespace trellis

#include "trellis/mime-mappings.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string_view>

#include "trellis/ascii.hpp"

namespace trellis {

static_assert(std::ranges::is_sorted(kMIMEMappings, {}, &MIMEMapping::extension),
              "kMIMEMappings must be sorted by extension");

std::string_view PathExtension(std::string_view path) {
  const auto slashPos = path.rfind('/');
  if (slashPos != std::string_view::npos) {
    path.remove_prefix(slashPos + 1);
  }
  const auto dotPos = path.rfind('.');
  if (dotPos == std::string_view::npos || dotPos == 0) {
    return {};
  }
  return path.substr(dotPos + 1);
}

std::string_view LookupMIMEType(std::string_view extension) {
  if (extension.starts_with('.')) {
    extension.remove_prefix(1);
  }

  static constexpr std::size_t kMaximumKnownExtensionSize =
      std::ranges::max_element(kMIMEMappings, {}, [](const MIMEMapping& mapping) {
        return mapping.extension.size();
      })->extension.size();

  if (extension.empty() || extension.size() > kMaximumKnownExtensionSize) {
    return {};
  }

  char extBuf[kMaximumKnownExtensionSize];
  const auto endIt = std::ranges::transform(extension, extBuf, AsciiLower).out;

  const std::string_view ext(extBuf, endIt);
  const auto it = std::ranges::lower_bound(kMIMEMappings, ext, {}, &MIMEMapping::extension);
  if (it != std::end(kMIMEMappings) && it->extension == ext) {
    return it->mimeType;
  }
  return {};
}

std::string_view DetermineMIMETypeStr(std::string_view path) {
  const std::string_view mimeType = LookupMIMEType(PathExtension(path));
  return mimeType.empty() ? kDefaultMIMEType : mimeType;
}

}  // namespace trellis

#include "trellis/file-system.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "trellis/mime-mappings.hpp"
#include "trellis/vector.hpp"

namespace trellis {

namespace {

// Non empty components of a '/' separated path.
vector<std::string_view> SplitComponents(std::string_view path) {
  vector<std::string_view> components;
  while (!path.empty()) {
    const auto slashPos = path.find('/');
    const std::string_view component = path.substr(0, slashPos);
    if (!component.empty()) {
      components.push_back(component);
    }
    if (slashPos == std::string_view::npos) {
      break;
    }
    path.remove_prefix(slashPos + 1);
  }
  return components;
}

}  // namespace

std::string FileSystem::join(std::string_view base, std::string_view relative) {
  const bool absolute = base.starts_with('/') || (base.empty() && relative.starts_with('/'));

  vector<std::string_view> stack;
  std::size_t leadingParents = 0;
  for (std::string_view part : {base, relative}) {
    for (std::string_view component : SplitComponents(part)) {
      if (component == ".") {
        continue;
      }
      if (component != "..") {
        stack.push_back(component);
      } else if (!stack.empty()) {
        stack.pop_back();
      } else if (!absolute) {
        ++leadingParents;
      }
    }
  }

  std::string joined = absolute ? "/" : "";
  for (std::size_t parent = 0; parent < leadingParents; ++parent) {
    joined.append("../");
  }
  for (std::string_view component : stack) {
    joined.append(component);
    joined.push_back('/');
  }
  if (joined.size() > 1 && joined.back() == '/') {
    joined.pop_back();
  }
  if (joined.empty()) {
    joined = ".";
  }
  return joined;
}

bool FileSystem::contains(std::string_view root, std::string_view path) noexcept {
  if (root == "/") {
    return path.starts_with('/');
  }
  if (root.ends_with('/')) {
    root.remove_suffix(1);
  }
  return path.starts_with(root) && (path.size() == root.size() || path[root.size()] == '/');
}

std::string FileSystem::relativeFromFile(std::string_view source, std::string_view target) {
  const auto sourceComponents = SplitComponents(source);
  const auto targetComponents = SplitComponents(target);
  // The directory of 'source' is 'source' minus its last component.
  const std::size_t sourceDirSize = sourceComponents.empty() ? 0 : sourceComponents.size() - 1;

  std::size_t common = 0;
  while (common < sourceDirSize && common < targetComponents.size() &&
         sourceComponents[common] == targetComponents[common]) {
    ++common;
  }

  std::string relative;
  for (std::size_t pos = common; pos < sourceDirSize; ++pos) {
    relative.append("../");
  }
  for (std::size_t pos = common; pos < targetComponents.size(); ++pos) {
    relative.append(targetComponents[pos]);
    if (pos + 1 != targetComponents.size()) {
      relative.push_back('/');
    }
  }
  return relative;
}

std::string_view FileSystem::extension(std::string_view path) noexcept { return PathExtension(path); }

}  // namespace trellis

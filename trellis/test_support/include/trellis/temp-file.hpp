#pragma once

#include <filesystem>
#include <string_view>

namespace trellis::test {

// Fresh directory below the system temp directory, removed recursively when the object goes out of scope.
// All the helpers take paths relative to it and create missing parent directories.
class ScopedTempDir {
 public:
  ScopedTempDir();

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  ~ScopedTempDir();

  // Canonical path of the directory.
  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

  // Writes (or truncates) a file with 'content'.
  std::filesystem::path writeFile(std::string_view relativePath, std::string_view content) const;

  std::filesystem::path makeDir(std::string_view relativePath) const;

  // 'target' is stored as is in the link, relative targets are resolved from the link's directory.
  std::filesystem::path makeSymlink(const std::filesystem::path& target, std::string_view linkRelativePath) const;

 private:
  std::filesystem::path _dir;
};

}  // namespace trellis::test

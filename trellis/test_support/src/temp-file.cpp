#include "trellis/temp-file.hpp"

#include <stdlib.h>

#include <filesystem>
#include <fstream>
#include <ios>
#include <string>
#include <string_view>
#include <system_error>

#include "trellis/log.hpp"
#include "trellis/system-error.hpp"

namespace trellis::test {

ScopedTempDir::ScopedTempDir() {
  std::string pattern = (std::filesystem::temp_directory_path() / "trellis-test-XXXXXX").string();
  if (::mkdtemp(pattern.data()) == nullptr) {
    throw ErrnoError("Unable to create a temporary directory from '{}'", pattern);
  }
  // temp_directory_path may itself be a symbolic link (macOS, some containers)
  _dir = std::filesystem::canonical(pattern);
  log::trace("Created temporary directory {}", _dir.string());
}

ScopedTempDir::~ScopedTempDir() {
  std::error_code ec;
  std::filesystem::remove_all(_dir, ec);
  if (ec) {
    log::warn("Unable to remove temporary directory {}: {}", _dir.string(), ec.message());
  }
}

std::filesystem::path ScopedTempDir::writeFile(std::string_view relativePath, std::string_view content) const {
  auto path = _dir / relativePath;
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
  out.close();
  if (!out) {
    throw std::system_error(std::make_error_code(std::errc::io_error), "Unable to write " + path.string());
  }
  return path;
}

std::filesystem::path ScopedTempDir::makeDir(std::string_view relativePath) const {
  auto path = _dir / relativePath;
  std::filesystem::create_directories(path);
  return path;
}

std::filesystem::path ScopedTempDir::makeSymlink(const std::filesystem::path& target,
                                                 std::string_view linkRelativePath) const {
  auto link = _dir / linkRelativePath;
  std::filesystem::create_directories(link.parent_path());
  std::filesystem::create_symlink(target, link);
  return link;
}

}  // namespace trellis::test

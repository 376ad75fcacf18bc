#include <sys/stat.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include "trellis/byte-range.hpp"
#include "trellis/system-error.hpp"
#include "trellis/file-system.hpp"
#include "trellis/file.hpp"
#include "trellis/log.hpp"
#include "trellis/timedef.hpp"

namespace trellis {

FileStat LocalFileSystem::stat(const std::string& path) const {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    throw ErrnoError("stat failed for '{}'", path);
  }
  FileStat ret;
  ret.isFile = S_ISREG(st.st_mode);
  ret.isDirectory = S_ISDIR(st.st_mode);
  ret.size = static_cast<std::size_t>(st.st_size);
  ret.inode = static_cast<std::uint64_t>(st.st_ino);
  ret.mtime = SysTimePoint(std::chrono::duration_cast<SysDuration>(std::chrono::seconds{st.st_mtim.tv_sec} +
                                                                   std::chrono::nanoseconds{st.st_mtim.tv_nsec}));
  return ret;
}

FileSlice LocalFileSystem::open(const std::string& path, std::optional<ByteRange> range) const {
  auto file = std::make_shared<const File>(path);
  const std::size_t fileSize = file->size();
  FileSlice slice{std::move(file), 0, fileSize};
  if (range) {
    slice.offset = std::min(range->begin, fileSize);
    slice.length = std::max(std::min(range->end, fileSize), slice.offset) - slice.offset;
  }
  return slice;
}

std::string LocalFileSystem::canonical(const std::string& path) const {
  std::error_code ec;
  auto canonicalPath = std::filesystem::canonical(path, ec);
  if (ec) {
    log::debug("Unable to canonicalize '{}': {}", path, ec.message());
    throw std::system_error(ec, "canonical failed for '" + path + "'");
  }
  return canonicalPath.string();
}

std::shared_ptr<const FileSystem> DefaultFileSystem() {
  static const auto kLocalFileSystem = std::make_shared<const LocalFileSystem>();
  return kLocalFileSystem;
}

}  // namespace trellis

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "trellis/byte-range.hpp"
#include "trellis/file.hpp"
#include "trellis/timedef.hpp"

namespace trellis {

struct FileStat {
  bool isFile{};
  bool isDirectory{};
  std::size_t size{};
  std::uint64_t inode{};
  SysTimePoint mtime;
};

// An opened file restricted to [offset, offset + length).
struct FileSlice {
  std::shared_ptr<const File> file;
  std::size_t offset{};
  std::size_t length{};
};

// File system services consumed by the file responders. Lookups throw std::system_error when the path cannot be
// resolved, the path manipulation helpers are purely lexical.
class FileSystem {
 public:
  FileSystem() noexcept = default;
  FileSystem(const FileSystem&) = delete;
  FileSystem& operator=(const FileSystem&) = delete;
  virtual ~FileSystem() = default;

  [[nodiscard]] virtual FileStat stat(const std::string& path) const = 0;

  // Opens 'path', restricted to 'range' when given (the range is clamped to the file size).
  [[nodiscard]] virtual FileSlice open(const std::string& path, std::optional<ByteRange> range = {}) const = 0;

  // Absolute path with every symbolic link, "." and ".." resolved. The path must exist.
  [[nodiscard]] virtual std::string canonical(const std::string& path) const = 0;

  // Joins 'relative' to 'base' and normalizes the result lexically: repeated separators, "." and ".." are
  // collapsed and there is no trailing separator (except for "/"). ".." never climbs above "/".
  [[nodiscard]] static std::string join(std::string_view base, std::string_view relative);

  // Whether 'path' is 'root' itself or lies below it. Both paths are expected to be canonical.
  [[nodiscard]] static bool contains(std::string_view root, std::string_view path) noexcept;

  // Relative reference from the directory holding 'source' to 'target' ("/r/a/link", "/r/b/file" -> "../b/file").
  [[nodiscard]] static std::string relativeFromFile(std::string_view source, std::string_view target);

  // Extension of the last path component, without the dot.
  [[nodiscard]] static std::string_view extension(std::string_view path) noexcept;
};

// FileSystem implementation backed by the local POSIX file system.
class LocalFileSystem : public FileSystem {
 public:
  [[nodiscard]] FileStat stat(const std::string& path) const override;

  [[nodiscard]] FileSlice open(const std::string& path, std::optional<ByteRange> range = {}) const override;

  [[nodiscard]] std::string canonical(const std::string& path) const override;
};

// Process wide LocalFileSystem instance, used when no file system is injected.
std::shared_ptr<const FileSystem> DefaultFileSystem();

}  // namespace trellis

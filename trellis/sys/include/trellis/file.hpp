#pragma once

#include <cstddef>
#include <span>
#include <string>

#include "trellis/owned-fd.hpp"

namespace trellis {

// Read only regular file handle. Reads are positional (pread) so that several slices of the same File may be
// consumed independently.
class File {
 public:
  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Opens given path for reading. Throws std::system_error on failure.
  explicit File(const std::string& path);

  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // File size in bytes, at the time of opening.
  [[nodiscard]] std::size_t size() const noexcept { return _fileSize; }

  // Reads up to dst.size() bytes starting at the given absolute offset. Returns the number of bytes read, 0 on EOF.
  // Throws std::system_error on read failure.
  [[nodiscard]] std::size_t readAt(std::span<char> dst, std::size_t offset) const;

  // Reads [offset, offset + length) in full, the result is shorter only if the file was truncated meanwhile.
  [[nodiscard]] std::string readRange(std::size_t offset, std::size_t length) const;

 private:
  OwnedFd _fd;
  std::size_t _fileSize{};
};

}  // namespace trellis

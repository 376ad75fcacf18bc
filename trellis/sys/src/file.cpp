#include "trellis/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <span>
#include <string>

#include "trellis/system-error.hpp"
#include "trellis/log.hpp"

namespace trellis {

File::File(const std::string& path) : _fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {
  if (!_fd) {
    throw ErrnoError("Unable to open file '{}'", path);
  }
  struct stat st{};
  if (::fstat(_fd.get(), &st) != 0) {
    throw ErrnoError("Unable to stat opened file '{}'", path);
  }
  _fileSize = static_cast<std::size_t>(st.st_size);
  log::trace("Opened file '{}' as fd # {} ({} bytes)", path, _fd.get(), _fileSize);
}

std::size_t File::readAt(std::span<char> dst, std::size_t offset) const {
  while (true) {
    const auto nbRead = ::pread(_fd.get(), dst.data(), dst.size(), static_cast<off_t>(offset));
    if (nbRead >= 0) {
      return static_cast<std::size_t>(nbRead);
    }
    if (errno != EINTR) {
      throw ErrnoError("pread of {} bytes at offset {} failed on fd # {}", dst.size(), offset, _fd.get());
    }
  }
}

std::string File::readRange(std::size_t offset, std::size_t length) const {
  std::string content(length, '\0');
  std::size_t done = 0;
  while (done < length) {
    const std::size_t nbRead = readAt(std::span<char>(content.data() + done, length - done), offset + done);
    if (nbRead == 0) {
      break;
    }
    done += nbRead;
  }
  content.resize(done);
  return content;
}

}  // namespace trellis

#pragma once

#include <utility>

namespace trellis {

// Unique owner of a POSIX file descriptor, closed on destruction.
class OwnedFd {
 public:
  static constexpr int kNoFd = -1;

  OwnedFd() noexcept = default;

  explicit OwnedFd(int fd) noexcept : _fd(fd) {}

  OwnedFd(const OwnedFd&) = delete;
  OwnedFd& operator=(const OwnedFd&) = delete;

  OwnedFd(OwnedFd&& other) noexcept : _fd(other.release()) {}
  OwnedFd& operator=(OwnedFd&& other) noexcept {
    reset(other.release());
    return *this;
  }

  ~OwnedFd() { reset(); }

  [[nodiscard]] int get() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd >= 0; }

  // Gives up ownership, the caller becomes responsible for closing the returned descriptor.
  [[nodiscard]] int release() noexcept { return std::exchange(_fd, kNoFd); }

  // Closes the owned descriptor (if any) and takes ownership of 'fd'.
  void reset(int fd = kNoFd) noexcept;

 private:
  int _fd{kNoFd};
};

}  // namespace trellis

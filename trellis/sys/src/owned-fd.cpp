#include "trellis/owned-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <system_error>
#include <utility>

#include "trellis/log.hpp"

namespace trellis {

void OwnedFd::reset(int fd) noexcept {
  const int previous = std::exchange(_fd, fd);
  if (previous < 0 || previous == fd) {
    return;
  }
  // Linux releases the descriptor even when close fails with EINTR, so it is never retried.
  if (::close(previous) != 0) {
    const std::error_code ec(errno, std::generic_category());
    if (ec != std::errc::interrupted) {
      log::warn("Unable to close fd # {}: {}", previous, ec.message());
    }
    return;
  }
  log::trace("Closed fd # {}", previous);
}

}  // namespace trellis

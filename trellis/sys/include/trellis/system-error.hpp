#pragma once

#include <cerrno>
#include <format>
#include <system_error>
#include <utility>

namespace trellis {

// std::system_error for the current errno value, with a std::format'ed description.
// Call it right after the failing system call: formatting may clobber errno otherwise.
template <typename... Args>
std::system_error ErrnoError(std::format_string<Args...> what, Args&&... args) {
  const std::error_code ec(errno, std::generic_category());
  return {ec, std::format(what, std::forward<Args>(args)...)};
}

}  // namespace trellis

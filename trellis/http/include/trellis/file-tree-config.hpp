#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "trellis/app.hpp"
#include "trellis/file-system.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/task.hpp"

namespace trellis {

// Serves the regular file at the canonical 'path', with an optional forced content type.
using FileHandler =
    std::function<Task<HttpResponse>(HttpRequest request, std::string path, std::optional<std::string> contentType)>;

// Serves the directory at the canonical 'path'.
using DirectoryHandler = std::function<Task<HttpResponse>(HttpRequest request, std::string path)>;

// Builds a redirect response to 'location' (relative to the request path).
using RedirectFunction = std::function<HttpResponse(const HttpRequest& request, std::string_view location)>;

/// Configuration knobs for FileTree (serving a file system tree). Empty callbacks select the default behavior.
struct FileTreeConfig {
  void validate() const;

  /// Answers paths that do not exist, escape the root or are neither files nor directories. Defaults to notFound().
  App notFound;

  /// Defaults to serveFile on 'fileSystem'.
  FileHandler file;

  /// Defaults to a handler failing with "directory listing not yet implemented".
  DirectoryHandler directory;

  /// Forced Content-Type of served files, deduced from the file extension when absent.
  std::optional<std::string> contentType;

  /// Whether a path traversing symbolic links is answered by a redirect to its canonical location instead of
  /// being served directly.
  bool redirectSymbolicLinks{false};

  /// Builds symbolic link redirects. Defaults to permanentRedirect when 'permanent' is set, to temporaryRedirect
  /// otherwise (a permanent request still gets a permanent redirect).
  RedirectFunction redirect;

  /// Whether symbolic link redirects are permanent.
  bool permanent{false};

  /// File system the tree is served from.
  std::shared_ptr<const FileSystem> fileSystem = DefaultFileSystem();
};

}  // namespace trellis

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "trellis/app.hpp"
#include "trellis/file-tree-config.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/task.hpp"
#include "trellis/vector.hpp"

namespace trellis {

// Serves the file system tree below a root directory, addressed by the request pathInfo.
// The requested path is percent-decoded, joined to the root and canonicalized, then it must still lie below the
// canonical root: '..' segments and symbolic links can never escape it.
// Can be used directly as an App.
class FileTree {
 public:
  // Throws std::invalid_argument if the root cannot be canonicalized or if the configuration is invalid.
  explicit FileTree(std::string_view root, FileTreeConfig config = {});

  Task<HttpResponse> operator()(HttpRequest request) const;

  // Canonical root directory.
  [[nodiscard]] std::string_view root() const noexcept;

 private:
  struct State;

  static Task<HttpResponse> Serve(std::shared_ptr<const State> state, HttpRequest request);

  std::shared_ptr<const State> _state;
};

// Default FileTreeConfig::directory handler: fails with std::runtime_error.
Task<HttpResponse> directoryNotImplemented(HttpRequest request, std::string path);

// FirstFound over a FileTree for each of 'roots', the first root having the file wins.
App FileOverlay(const vector<std::string>& roots, const FileTreeConfig& config = {});

}  // namespace trellis

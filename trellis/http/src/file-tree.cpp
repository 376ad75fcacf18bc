#include "trellis/file-tree.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "trellis/app.hpp"
#include "trellis/file-responder.hpp"
#include "trellis/file-system.hpp"
#include "trellis/file-tree-config.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/log.hpp"
#include "trellis/redirect.hpp"
#include "trellis/response-builders.hpp"
#include "trellis/routing.hpp"
#include "trellis/task.hpp"
#include "trellis/url-decode.hpp"
#include "trellis/url-encode.hpp"
#include "trellis/vector.hpp"

namespace trellis {

struct FileTree::State {
  std::string root;
  FileTreeConfig config;
};

namespace {

enum class Target : std::uint8_t { NotFound, Redirect, File, Directory };

struct Resolution {
  Target target{Target::NotFound};
  std::string path;
  std::string location;
};

Resolution ResolveTarget(const std::string& root, const FileTreeConfig& config, std::string_view pathInfo) {
  Resolution resolution;
  const auto decoded = url::DecodeComponent(pathInfo);
  if (!decoded) {
    log::debug("Malformed escape in '{}'", pathInfo);
    return resolution;
  }
  const std::string path = FileSystem::join(root, *decoded);
  const FileSystem& fileSystem = *config.fileSystem;
  try {
    std::string canonicalPath = fileSystem.canonical(path);
    if (!FileSystem::contains(root, canonicalPath)) {
      log::warn("'{}' resolves to '{}' outside of '{}'", path, canonicalPath, root);
      return resolution;
    }
    if (path != canonicalPath && config.redirectSymbolicLinks) {
      resolution.target = Target::Redirect;
      // file system names are raw bytes, the location must be a valid URI reference
      resolution.location = url::EncodePath(FileSystem::relativeFromFile(path, canonicalPath));
      return resolution;
    }
    const FileStat stat = fileSystem.stat(canonicalPath);
    if (stat.isFile) {
      resolution.target = Target::File;
    } else if (stat.isDirectory) {
      resolution.target = Target::Directory;
    }
    resolution.path = std::move(canonicalPath);
  } catch (const std::system_error& ex) {
    log::debug("Unable to resolve '{}': {}", path, ex.what());
  }
  return resolution;
}

}  // namespace

Task<HttpResponse> directoryNotImplemented(HttpRequest /*request*/, std::string path) {
  log::debug("Directory '{}' requested", path);
  throw std::runtime_error("directory listing not yet implemented");
  co_return HttpResponse(http::StatusCodeNotImplemented);
}

FileTree::FileTree(std::string_view root, FileTreeConfig config) {
  config.validate();
  auto state = std::make_shared<State>();
  try {
    state->root = config.fileSystem->canonical(std::string(root));
  } catch (const std::system_error& ex) {
    throw std::invalid_argument(std::string("Invalid FileTree root: ") + ex.what());
  }
  if (!config.notFound) {
    config.notFound = trellis::notFound();
  }
  if (!config.file) {
    config.file = [fileSystem = config.fileSystem](HttpRequest request, std::string path,
                                                   std::optional<std::string> contentType) {
      return serveFile(std::move(request), std::move(path), std::move(contentType), fileSystem);
    };
  }
  if (!config.directory) {
    config.directory = directoryNotImplemented;
  }
  if (!config.redirect) {
    if (config.permanent) {
      config.redirect = [](const HttpRequest& request, std::string_view location) {
        return permanentRedirect(request, location);
      };
    } else {
      config.redirect = [](const HttpRequest& request, std::string_view location) {
        return temporaryRedirect(request, location);
      };
    }
  }
  state->config = std::move(config);
  _state = std::move(state);
}

std::string_view FileTree::root() const noexcept { return _state->root; }

Task<HttpResponse> FileTree::operator()(HttpRequest request) const { return Serve(_state, std::move(request)); }

Task<HttpResponse> FileTree::Serve(std::shared_ptr<const State> state, HttpRequest request) {
  const FileTreeConfig& config = state->config;
  Resolution resolution = ResolveTarget(state->root, config, request.pathInfo());
  switch (resolution.target) {
    case Target::Redirect:
      co_return config.redirect(request, resolution.location);
    case Target::File:
      co_return co_await config.file(std::move(request), std::move(resolution.path), config.contentType);
    case Target::Directory:
      co_return co_await config.directory(std::move(request), std::move(resolution.path));
    default:
      co_return co_await config.notFound(std::move(request));
  }
}

App FileOverlay(const vector<std::string>& roots, const FileTreeConfig& config) {
  vector<App> trees;
  for (const auto& root : roots) {
    trees.emplace_back(FileTree(root, config));
  }
  return FirstFound(std::move(trees));
}

}  // namespace trellis

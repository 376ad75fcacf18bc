#include "trellis/file-responder.hpp"

#include <cstddef>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "trellis/app.hpp"
#include "trellis/byte-range.hpp"
#include "trellis/file-system.hpp"
#include "trellis/http-body.hpp"
#include "trellis/http-constants.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/log.hpp"
#include "trellis/mime-mappings.hpp"
#include "trellis/response-builders.hpp"
#include "trellis/task.hpp"
#include "trellis/vector.hpp"

namespace trellis {

namespace {

// Range to serve, std::nullopt to serve the whole content.
std::optional<ByteRange> RequestedRange(const HttpRequest& request, std::string_view entityTag,
                                        std::size_t fileSize) {
  const auto rangeHeader = request.headerValue(http::Range);
  if (!rangeHeader) {
    return std::nullopt;
  }
  const auto ifRange = request.headerValue(http::IfRange);
  if (ifRange && *ifRange != entityTag) {
    log::debug("If-Range precondition failed for '{}', serving whole content", request.path());
    return std::nullopt;
  }
  auto range = InterpretFirstRange(*rangeHeader, fileSize);
  if (!range) {
    log::debug("Ignoring invalid range header '{}'", *rangeHeader);
  }
  return range;
}

struct ConcatState {
  vector<std::string> paths;
  std::shared_ptr<const FileSystem> fileSystem;
  std::size_t nextPos{};
};

Task<std::optional<std::string>> ReadNextFile(std::shared_ptr<ConcatState> state) {
  if (state->nextPos == state->paths.size()) {
    co_return std::nullopt;
  }
  const FileSlice slice = state->fileSystem->open(state->paths[state->nextPos++]);
  co_return slice.file->readRange(slice.offset, slice.length);
}

Task<HttpResponse> ServeFixedFile(std::string path, std::optional<std::string> contentType, App notFound,
                                  std::shared_ptr<const FileSystem> fileSystem, HttpRequest request) {
  bool readable = true;
  try {
    // missing or non regular files are answered by notFound
    const FileStat stat = fileSystem->stat(path);
    readable = stat.isFile;
  } catch (const std::system_error& ex) {
    log::debug("Unable to stat '{}': {}", path, ex.what());
    readable = false;
  }
  if (!readable) {
    co_return co_await notFound(std::move(request));
  }
  co_return co_await serveFile(std::move(request), std::move(path), std::move(contentType), std::move(fileSystem));
}

Task<HttpResponse> ServeConcat(std::shared_ptr<const ConcatState> prototype, std::string contentType,
                               HttpRequest /*request*/) {
  // Each response gets its own read cursor.
  auto state = std::make_shared<ConcatState>(*prototype);
  HttpBody body = HttpBody::Stream([state]() { return ReadNextFile(state); });
  co_return HttpResponse(http::StatusCodeOK).contentType(contentType).body(std::move(body));
}

}  // namespace

Task<HttpResponse> serveFile(HttpRequest request, std::string path, std::optional<std::string> contentType,
                             std::shared_ptr<const FileSystem> fileSystem) {
  const std::string type = contentType ? std::move(*contentType) : std::string(DetermineMIMETypeStr(path));
  const FileStat stat = fileSystem->stat(path);
  const std::string entityTag = etag(stat);
  const std::size_t fileSize = stat.size;

  if (const auto range = RequestedRange(request, entityTag, fileSize)) {
    if (range->end > fileSize || range->begin >= range->end) {
      co_return HttpResponse(http::StatusCodeRangeNotSatisfiable)
          .header(http::ContentRange, std::format("bytes */{}", fileSize));
    }
    FileSlice slice = fileSystem->open(path, *range);
    co_return HttpResponse(http::StatusCodePartialContent)
        .contentType(type)
        .header(http::ETag, entityTag)
        .header(http::ContentRange, std::format("bytes {}-{}/{}", range->begin, range->end - 1, fileSize))
        .header(http::ContentLength, range->length())
        .body(HttpBody::FromFile(std::move(slice)));
  }

  if (!request.headerValue(http::Range) && request.headerValueOrEmpty(http::IfNoneMatch) == entityTag) {
    co_return HttpResponse(http::StatusCodeNotModified).header(http::ETag, entityTag);
  }

  FileSlice slice = fileSystem->open(path);
  co_return HttpResponse(http::StatusCodeOK)
      .contentType(type)
      .header(http::ETag, entityTag)
      .header(http::ContentLength, slice.length)
      .body(HttpBody::FromFile(std::move(slice)));
}

App FileApp(std::string path, std::optional<std::string> contentType, App notFound,
            std::shared_ptr<const FileSystem> fileSystem) {
  if (!notFound) {
    notFound = trellis::notFound();
  }
  return [path = std::move(path), contentType = std::move(contentType), notFound = std::move(notFound),
          fileSystem = std::move(fileSystem)](HttpRequest request) {
    return ServeFixedFile(path, contentType, notFound, fileSystem, std::move(request));
  };
}

App FileConcat(vector<std::string> paths, std::string contentType, std::shared_ptr<const FileSystem> fileSystem) {
  auto prototype = std::make_shared<const ConcatState>(std::move(paths), std::move(fileSystem));
  return [prototype = std::move(prototype), contentType = std::move(contentType)](HttpRequest request) {
    return ServeConcat(prototype, contentType, std::move(request));
  };
}

}  // namespace trellis

#include "trellis/response-builders.hpp"

#include <chrono>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/app.hpp"
#include "trellis/file-system.hpp"
#include "trellis/http-constants.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/task.hpp"

namespace trellis {

namespace {

Task<HttpResponse> RespondStatus(http::StatusCode status, HttpRequest request) {
  std::string message(request.method());
  message.push_back(' ');
  message.append(request.path());
  co_return responseForStatus(status, message);
}

}  // namespace

HttpResponse ok(std::string content, std::string_view contentType, http::StatusCode status) {
  return HttpResponse(status).body(std::move(content), contentType);
}

HttpResponse responseForStatus(http::StatusCode status, std::string_view message) {
  const std::string_view reason = http::ReasonPhraseFor(status);
  if (reason.empty()) {
    throw std::invalid_argument(std::format("No reason phrase for status {}", status));
  }
  if (http::IsBodilessStatus(status)) {
    return HttpResponse(status);
  }
  std::string body(reason);
  if (!message.empty()) {
    body.append(": ");
    body.append(message);
  }
  body.append("\r\n");
  return ok(std::move(body), http::ContentTypeTextPlain, status);
}

App appForStatus(http::StatusCode status) {
  // Fails early for an unknown status rather than at the first request.
  if (http::ReasonPhraseFor(status).empty()) {
    throw std::invalid_argument(std::format("No reason phrase for status {}", status));
  }
  return [status](HttpRequest request) { return RespondStatus(status, std::move(request)); };
}

App badRequest() { return appForStatus(http::StatusCodeBadRequest); }

App notFound() { return appForStatus(http::StatusCodeNotFound); }

App methodNotAllowed() { return appForStatus(http::StatusCodeMethodNotAllowed); }

App notAcceptable() { return appForStatus(http::StatusCodeNotAcceptable); }

std::string etag(const FileStat& stat) {
  const auto mtimeMs =
      std::chrono::duration_cast<std::chrono::milliseconds>(stat.mtime.time_since_epoch()).count();
  return std::format("{}-{}-{}", stat.inode, stat.size, mtimeMs);
}

}  // namespace trellis

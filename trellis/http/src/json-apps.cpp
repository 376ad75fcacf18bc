#include "trellis/json-apps.hpp"

#include <string>
#include <utility>

#include "trellis/app.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/response-builders.hpp"
#include "trellis/task.hpp"

namespace trellis {

namespace detail {

Task<HttpResponse> ContentRequestApp(ContentHandler handler, HttpRequest request) {
  std::string content = co_await request.body().readAll();
  co_return co_await handler(std::move(content), std::move(request));
}

}  // namespace detail

namespace {

Task<HttpResponse> ContentApp(std::string body, std::string contentType, http::StatusCode status,
                              HttpRequest /*request*/) {
  co_return ok(std::move(body), contentType, status);
}

}  // namespace

App Content(std::string body, std::string contentType, http::StatusCode status) {
  return [body = std::move(body), contentType = std::move(contentType), status](HttpRequest request) {
    return ContentApp(body, contentType, status, std::move(request));
  };
}

App ContentRequest(ContentHandler handler) {
  return [handler = std::move(handler)](HttpRequest request) {
    return detail::ContentRequestApp(handler, std::move(request));
  };
}

}  // namespace trellis

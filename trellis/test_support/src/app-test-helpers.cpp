#include "trellis/app-test-helpers.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/app.hpp"
#include "trellis/http-constants.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/response-builders.hpp"
#include "trellis/task.hpp"

namespace trellis::test {

namespace {

Task<HttpResponse> RespondApp(http::StatusCode status, std::string body, HttpRequest /*request*/) {
  co_return ok(std::move(body), http::ContentTypeTextPlain, status);
}

Task<HttpResponse> FailingApp(std::string message, HttpRequest /*request*/) {
  throw std::runtime_error(message);
  co_return HttpResponse(http::StatusCodeInternalServerError);
}

Task<HttpResponse> DeferredApp(TaskQueue* queue, App app, HttpRequest request) {
  co_await queue->yield();
  co_return co_await app(std::move(request));
}

Task<HttpResponse> EchoPathApp(HttpRequest request) {
  std::string body(request.scriptName());
  body.push_back('|');
  body.append(request.pathInfo());
  co_return ok(std::move(body));
}

}  // namespace

HttpRequest MakeRequest(std::string_view method, std::string_view target, HeaderList headers) {
  HttpRequest request(method, target);
  request.remote("127.0.0.1", 40000).serverPort(8080);
  for (const auto& [name, value] : headers) {
    request.header(name, value);
  }
  return request;
}

HttpResponse Run(const App& app, HttpRequest request) { return SyncWait(app(std::move(request))); }

HttpResponse Run(const App& app, HttpRequest request, TaskQueue& queue) {
  return SyncWait(app(std::move(request)), queue);
}

std::string BodyOf(HttpResponse& response) { return SyncWait(response.body().readAll()); }

App Respond(http::StatusCode status, std::string body) {
  return [status, body = std::move(body)](HttpRequest request) { return RespondApp(status, body, std::move(request)); };
}

App Failing(std::string message) {
  return [message = std::move(message)](HttpRequest request) { return FailingApp(message, std::move(request)); };
}

App Deferred(TaskQueue& queue, App app) {
  return [queue = &queue, app = std::move(app)](HttpRequest request) {
    return DeferredApp(queue, app, std::move(request));
  };
}

App EchoPath() { return EchoPathApp; }

}  // namespace trellis::test

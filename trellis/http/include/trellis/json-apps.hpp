#pragma once

#include <functional>
#include <string>
#include <utility>

#include "trellis/app.hpp"
#include "trellis/http-constants.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/json-serializer.hpp"
#include "trellis/response-builders.hpp"
#include "trellis/task.hpp"

namespace trellis {

// Produces a value of type T for a request.
template <class T>
using Producer = std::function<Task<T>(HttpRequest)>;

// Receives the whole request body along with the request.
using ContentHandler = std::function<Task<HttpResponse>(std::string content, HttpRequest request)>;

// Receives the request body decoded as JSON along with the request.
template <class T>
using JsonHandler = std::function<Task<HttpResponse>(T value, HttpRequest request)>;

namespace detail {

template <class T>
Task<HttpResponse> JsonApp(Producer<T> producer, HttpRequest request) {
  const T value = co_await producer(std::move(request));
  co_return json(value);
}

template <class T>
Task<HttpResponse> InspectApp(Producer<T> producer, HttpRequest request) {
  if (request.method() != http::GET) {
    co_return co_await methodNotAllowed()(std::move(request));
  }
  const T value = co_await producer(std::move(request));
  co_return ok(SerializeToJson(value), http::ContentTypeTextPlain);
}

Task<HttpResponse> ContentRequestApp(ContentHandler handler, HttpRequest request);

template <class T>
Task<HttpResponse> JsonRequestApp(JsonHandler<T> handler, App badRequest, HttpRequest request) {
  const std::string content = co_await request.body().readAll();
  auto value = ParseJson<T>(content);
  if (!value) {
    co_return co_await badRequest(std::move(request));
  }
  co_return co_await handler(std::move(*value), std::move(request));
}

}  // namespace detail

// Responds the JSON serialization of the value produced for each request.
template <class T>
App Json(Producer<T> producer) {
  return [producer = std::move(producer)](HttpRequest request) {
    return detail::JsonApp<T>(producer, std::move(request));
  };
}

// Static in-memory content.
App Content(std::string body, std::string contentType = std::string(http::ContentTypeTextPlain),
            http::StatusCode status = http::StatusCodeOK);

// Reads the whole request body and passes it to 'handler'.
App ContentRequest(ContentHandler handler);

// Parses the request body as a JSON T and passes it to 'handler'. Bodies that cannot be parsed are answered by
// 'badRequest' (400 by default).
template <class T>
App JsonRequest(JsonHandler<T> handler, App badRequest = {}) {
  if (!badRequest) {
    badRequest = trellis::badRequest();
  }
  return [handler = std::move(handler), badRequest = std::move(badRequest)](HttpRequest request) {
    return detail::JsonRequestApp<T>(handler, badRequest, std::move(request));
  };
}

// Debugging helper: responds the JSON rendering of the produced value as text/plain, to GET requests only (405 for
// the other methods).
template <class T>
App Inspect(Producer<T> producer) {
  return [producer = std::move(producer)](HttpRequest request) {
    return detail::InspectApp<T>(producer, std::move(request));
  };
}

}  // namespace trellis

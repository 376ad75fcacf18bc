#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/headers-map.hpp"
#include "trellis/http-body.hpp"
#include "trellis/http-constants.hpp"
#include "trellis/http-status-code.hpp"

namespace trellis {

// HTTP response produced by an App: a status code, headers with lower case names kept in insertion order, and a
// body. Setters are chainable on lvalues and rvalues:
//   co_return HttpResponse(http::StatusCodeOK).header(http::ContentType, "text/plain").body(HttpBody("hello"));
class HttpResponse {
 public:
  explicit HttpResponse(http::StatusCode statusCode = http::StatusCodeOK) noexcept : _status(statusCode) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] const HeadersMap& headers() const noexcept { return _headers; }
  [[nodiscard]] HeadersMap& headers() noexcept { return _headers; }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return _headers.get(name);
  }

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return _headers.getOrEmpty(name);
  }

  [[nodiscard]] const HttpBody& body() const noexcept { return _body; }
  [[nodiscard]] HttpBody& body() noexcept { return _body; }

  // Replaces the status code.
  HttpResponse& status(http::StatusCode statusCode) & noexcept {
    _status = statusCode;
    return *this;
  }

  // Replaces the status code.
  HttpResponse&& status(http::StatusCode statusCode) && noexcept {
    _status = statusCode;
    return std::move(*this);
  }

  // Inserts or replaces given header.
  HttpResponse& header(std::string_view name, std::string_view value) & {
    _headers.set(name, value);
    return *this;
  }

  // Inserts or replaces given header.
  HttpResponse&& header(std::string_view name, std::string_view value) && {
    _headers.set(name, value);
    return std::move(*this);
  }

  HttpResponse& header(std::string_view name, std::integral auto value) & {
    return header(name, std::string_view(std::to_string(value)));
  }

  HttpResponse&& header(std::string_view name, std::integral auto value) && {
    header(name, std::string_view(std::to_string(value)));
    return std::move(*this);
  }

  // Inserts given header only if the response does not have it yet.
  HttpResponse& headerIfAbsent(std::string_view name, std::string_view value) & {
    _headers.setIfAbsent(name, value);
    return *this;
  }

  HttpResponse&& headerIfAbsent(std::string_view name, std::string_view value) && {
    _headers.setIfAbsent(name, value);
    return std::move(*this);
  }

  // Inserts or replaces the Location header.
  HttpResponse& location(std::string_view location) & { return header(http::Location, location); }

  HttpResponse&& location(std::string_view location) && {
    header(http::Location, location);
    return std::move(*this);
  }

  // Inserts or replaces the Content-Type header.
  HttpResponse& contentType(std::string_view contentType) & { return header(http::ContentType, contentType); }

  HttpResponse&& contentType(std::string_view contentType) && {
    header(http::ContentType, contentType);
    return std::move(*this);
  }

  // Replaces the body. Headers are left untouched.
  HttpResponse& body(HttpBody body) & {
    _body = std::move(body);
    return *this;
  }

  HttpResponse&& body(HttpBody body) && {
    _body = std::move(body);
    return std::move(*this);
  }

  // Replaces the body with given in-memory content, and sets the Content-Type and Content-Length headers.
  HttpResponse& body(std::string content, std::string_view contentType) &;

  HttpResponse&& body(std::string content, std::string_view contentType) && {
    body(std::move(content), contentType);
    return std::move(*this);
  }

 private:
  HeadersMap _headers;
  HttpBody _body;
  http::StatusCode _status;
};

}  // namespace trellis

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/headers-map.hpp"
#include "trellis/http-body.hpp"
#include "trellis/http-constants.hpp"

namespace trellis {

struct Session;

// HTTP request as seen by an App.
// Apps receive requests by value: routing components derive a new request for each step instead of altering the
// caller's one.
//
// Routing state: 'scriptName' is the already routed prefix of the path and always ends with '/', 'pathInfo' is the
// remaining suffix and is either empty or starts with '/'. At any routing depth, 'scriptName' without its trailing
// '/' followed by 'pathInfo' equals 'path'. Initially 'scriptName' is "/" and 'pathInfo' is 'path'.
class HttpRequest {
 public:
  using Terms = std::map<std::string, std::string, std::less<>>;

  HttpRequest() : HttpRequest(http::GET, "/") {}

  // Builds a request for given method and target ("/path?query"). The path part must start with '/', otherwise
  // std::invalid_argument is thrown.
  HttpRequest(std::string_view method, std::string_view target);

  [[nodiscard]] std::string_view method() const noexcept { return _method; }

  // Path of the request target, without query (still percent-encoded).
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Query part of the request target, without the '?'.
  [[nodiscard]] std::string_view query() const noexcept { return _query; }

  [[nodiscard]] std::uint8_t versionMajor() const noexcept { return _versionMajor; }
  [[nodiscard]] std::uint8_t versionMinor() const noexcept { return _versionMinor; }

  [[nodiscard]] std::string_view remoteHost() const noexcept { return _remoteHost; }
  [[nodiscard]] std::uint16_t remotePort() const noexcept { return _remotePort; }
  [[nodiscard]] std::uint16_t serverPort() const noexcept { return _serverPort; }

  [[nodiscard]] const HeadersMap& headers() const noexcept { return _headers; }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return _headers.get(name);
  }

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return _headers.getOrEmpty(name);
  }

  // Request body. Reading it consumes it.
  [[nodiscard]] HttpBody& body() noexcept { return _body; }
  [[nodiscard]] const HttpBody& body() const noexcept { return _body; }

  [[nodiscard]] std::string_view scriptName() const noexcept { return _scriptName; }
  [[nodiscard]] std::string_view pathInfo() const noexcept { return _pathInfo; }

  // Values negotiated so far, keyed by negotiation name ("content-type", "language", ...).
  [[nodiscard]] const Terms& terms() const noexcept { return _terms; }

  [[nodiscard]] std::optional<std::string_view> term(std::string_view name) const;

  // Whether redirects produced for this request should be permanent by default.
  [[nodiscard]] bool permanent() const noexcept { return _permanent; }

  [[nodiscard]] const std::shared_ptr<Session>& session() const noexcept { return _session; }

  HttpRequest& method(std::string_view method) & {
    _method.assign(method);
    return *this;
  }
  HttpRequest&& method(std::string_view method) && { return std::move(this->method(method)); }

  HttpRequest& version(std::uint8_t major, std::uint8_t minor) & noexcept {
    _versionMajor = major;
    _versionMinor = minor;
    return *this;
  }
  HttpRequest&& version(std::uint8_t major, std::uint8_t minor) && noexcept {
    return std::move(this->version(major, minor));
  }

  HttpRequest& remote(std::string_view host, std::uint16_t port) & {
    _remoteHost.assign(host);
    _remotePort = port;
    return *this;
  }
  HttpRequest&& remote(std::string_view host, std::uint16_t port) && { return std::move(remote(host, port)); }

  HttpRequest& serverPort(std::uint16_t port) & noexcept {
    _serverPort = port;
    return *this;
  }
  HttpRequest&& serverPort(std::uint16_t port) && noexcept { return std::move(serverPort(port)); }

  // Inserts or replaces given header (names are lower cased).
  HttpRequest& header(std::string_view name, std::string_view value) & {
    _headers.set(name, value);
    return *this;
  }
  HttpRequest&& header(std::string_view name, std::string_view value) && { return std::move(header(name, value)); }

  HttpRequest& body(HttpBody body) & {
    _body = std::move(body);
    return *this;
  }
  HttpRequest&& body(HttpBody body) && { return std::move(this->body(std::move(body))); }

  HttpRequest& term(std::string_view name, std::string_view value) &;
  HttpRequest&& term(std::string_view name, std::string_view value) && { return std::move(term(name, value)); }

  HttpRequest& permanent(bool permanent) & noexcept {
    _permanent = permanent;
    return *this;
  }
  HttpRequest&& permanent(bool permanent) && noexcept { return std::move(this->permanent(permanent)); }

  HttpRequest& session(std::shared_ptr<Session> session) & noexcept {
    _session = std::move(session);
    return *this;
  }
  HttpRequest&& session(std::shared_ptr<Session> session) && noexcept {
    return std::move(this->session(std::move(session)));
  }

  // Moves the first segment of 'pathInfo' to 'scriptName'. 'rawSegment' is the segment as it appears in the path
  // (still percent-encoded): 'pathInfo' must start with '/' followed by 'rawSegment', std::invalid_argument is
  // thrown otherwise.
  HttpRequest& consumeSegment(std::string_view rawSegment) &;
  HttpRequest&& consumeSegment(std::string_view rawSegment) && { return std::move(consumeSegment(rawSegment)); }

  // First segment of 'pathInfo' (without the leading '/'), still percent-encoded. Empty if 'pathInfo' is empty or
  // does not start with '/'.
  [[nodiscard]] std::string_view nextSegment() const noexcept;

 private:
  std::string _method;
  std::string _path;
  std::string _query;
  std::string _remoteHost;
  std::string _scriptName;
  std::string _pathInfo;
  HeadersMap _headers;
  HttpBody _body;
  Terms _terms;
  std::shared_ptr<Session> _session;
  std::uint16_t _remotePort{};
  std::uint16_t _serverPort{80};
  std::uint8_t _versionMajor{1};
  std::uint8_t _versionMinor{1};
  bool _permanent{false};
};

}  // namespace trellis

#include "trellis/http-request.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace trellis {

HttpRequest::HttpRequest(std::string_view method, std::string_view target) : _method(method) {
  const auto queryPos = target.find('?');
  const std::string_view path = target.substr(0, queryPos);
  if (!path.starts_with('/')) {
    throw std::invalid_argument("Request path should start with '/'");
  }
  _path.assign(path);
  if (queryPos != std::string_view::npos) {
    _query.assign(target.substr(queryPos + 1));
  }
  _scriptName = "/";
  _pathInfo = _path;
}

std::optional<std::string_view> HttpRequest::term(std::string_view name) const {
  const auto it = _terms.find(name);
  if (it == _terms.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

HttpRequest& HttpRequest::term(std::string_view name, std::string_view value) & {
  const auto it = _terms.find(name);
  if (it == _terms.end()) {
    _terms.emplace(std::string(name), std::string(value));
  } else {
    it->second.assign(value);
  }
  return *this;
}

std::string_view HttpRequest::nextSegment() const noexcept {
  std::string_view pathInfo = _pathInfo;
  if (!pathInfo.starts_with('/')) {
    return {};
  }
  pathInfo.remove_prefix(1);
  return pathInfo.substr(0, pathInfo.find('/'));
}

HttpRequest& HttpRequest::consumeSegment(std::string_view rawSegment) & {
  const std::string_view pathInfo = _pathInfo;
  if (!pathInfo.starts_with('/') || !pathInfo.substr(1).starts_with(rawSegment) ||
      (pathInfo.size() > 1 + rawSegment.size() && pathInfo[1 + rawSegment.size()] != '/')) {
    throw std::invalid_argument("Segment to consume is not the beginning of the remaining path");
  }
  _scriptName.append(rawSegment);
  _scriptName.push_back('/');
  _pathInfo.erase(0, 1 + rawSegment.size());
  return *this;
}

}  // namespace trellis

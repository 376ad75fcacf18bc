#include "trellis/url-resolve.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace trellis::url {

namespace {

struct UriParts {
  std::string_view scheme;
  std::string_view authority;
  std::string_view path;
  std::string_view query;
  std::string_view fragment;
  bool hasScheme{};
  bool hasAuthority{};
  bool hasQuery{};
  bool hasFragment{};
};

constexpr bool IsSchemeChar(char ch, bool first) {
  const bool alpha = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
  if (first) {
    return alpha;
  }
  return alpha || (ch >= '0' && ch <= '9') || ch == '+' || ch == '-' || ch == '.';
}

UriParts Split(std::string_view uri) {
  UriParts parts;

  const auto fragmentPos = uri.find('#');
  if (fragmentPos != std::string_view::npos) {
    parts.hasFragment = true;
    parts.fragment = uri.substr(fragmentPos + 1);
    uri = uri.substr(0, fragmentPos);
  }
  const auto queryPos = uri.find('?');
  if (queryPos != std::string_view::npos) {
    parts.hasQuery = true;
    parts.query = uri.substr(queryPos + 1);
    uri = uri.substr(0, queryPos);
  }

  const auto colonPos = uri.find(':');
  if (colonPos != std::string_view::npos && colonPos != 0 && colonPos < uri.find('/')) {
    bool validScheme = true;
    for (std::size_t pos = 0; pos < colonPos; ++pos) {
      validScheme = validScheme && IsSchemeChar(uri[pos], pos == 0);
    }
    if (validScheme) {
      parts.hasScheme = true;
      parts.scheme = uri.substr(0, colonPos);
      uri.remove_prefix(colonPos + 1);
    }
  }

  if (uri.starts_with("//")) {
    parts.hasAuthority = true;
    uri.remove_prefix(2);
    const auto slashPos = uri.find('/');
    parts.authority = uri.substr(0, slashPos);
    uri = slashPos == std::string_view::npos ? std::string_view{} : uri.substr(slashPos);
  }
  parts.path = uri;
  return parts;
}

std::string Merge(const UriParts& base, std::string_view relativePath) {
  if (base.hasAuthority && base.path.empty()) {
    std::string ret("/");
    ret.append(relativePath);
    return ret;
  }
  const auto lastSlash = base.path.rfind('/');
  std::string ret(lastSlash == std::string_view::npos ? std::string_view{} : base.path.substr(0, lastSlash + 1));
  ret.append(relativePath);
  return ret;
}

}  // namespace

std::string RemoveDotSegments(std::string_view path) {
  std::string out;
  out.reserve(path.size());

  const auto popLastSegment = [&out] {
    const auto lastSlash = out.rfind('/');
    out.resize(lastSlash == std::string::npos ? 0 : lastSlash);
  };

  while (!path.empty()) {
    if (path.starts_with("../")) {
      path.remove_prefix(3);
    } else if (path.starts_with("./")) {
      path.remove_prefix(2);
    } else if (path.starts_with("/./")) {
      path.remove_prefix(2);
    } else if (path == "/.") {
      path = "/";
    } else if (path.starts_with("/../")) {
      path.remove_prefix(3);
      popLastSegment();
    } else if (path == "/..") {
      path = "/";
      popLastSegment();
    } else if (path == "." || path == "..") {
      path = {};
    } else {
      const auto nextSlash = path.find('/', 1);
      const auto segment = path.substr(0, nextSlash);
      out.append(segment);
      path.remove_prefix(segment.size());
    }
  }
  return out;
}

std::string Resolve(std::string_view base, std::string_view reference) {
  const UriParts ref = Split(reference);
  const UriParts baseParts = Split(base);

  std::string_view scheme = baseParts.scheme;
  bool hasScheme = baseParts.hasScheme;
  std::string_view authority = baseParts.authority;
  bool hasAuthority = baseParts.hasAuthority;
  std::string path;
  std::string_view query = ref.query;
  bool hasQuery = ref.hasQuery;

  if (ref.hasScheme) {
    scheme = ref.scheme;
    hasScheme = true;
    authority = ref.authority;
    hasAuthority = ref.hasAuthority;
    path = RemoveDotSegments(ref.path);
  } else if (ref.hasAuthority) {
    authority = ref.authority;
    hasAuthority = true;
    path = RemoveDotSegments(ref.path);
  } else if (ref.path.empty()) {
    path = baseParts.path;
    if (!ref.hasQuery) {
      query = baseParts.query;
      hasQuery = baseParts.hasQuery;
    }
  } else if (ref.path.front() == '/') {
    path = RemoveDotSegments(ref.path);
  } else {
    path = RemoveDotSegments(Merge(baseParts, ref.path));
  }

  std::string ret;
  if (hasScheme) {
    ret.append(scheme);
    ret.push_back(':');
  }
  if (hasAuthority) {
    ret.append("//");
    ret.append(authority);
  }
  ret.append(path);
  if (hasQuery) {
    ret.push_back('?');
    ret.append(query);
  }
  if (ref.hasFragment) {
    ret.push_back('#');
    ret.append(ref.fragment);
  }
  return ret;
}

}  // namespace trellis::url

#include "trellis/cookie.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/ascii.hpp"
#include "trellis/timestring.hpp"
#include "trellis/url-decode.hpp"
#include "trellis/url-encode.hpp"

namespace trellis {

namespace {

std::string DecodeCookieToken(std::string_view token) {
  std::string ret(TrimOws(token));
  const char* newEnd = url::DecodeInPlace(ret.data(), ret.data() + ret.size(), ' ', false);
  ret.resize(static_cast<std::string::size_type>(newEnd - ret.data()));
  return ret;
}

}  // namespace

CookieJar CookieJar::Parse(std::string_view header) {
  CookieJar jar;
  while (!header.empty()) {
    const auto sepPos = header.find_first_of(";,");
    const std::string_view pair = header.substr(0, sepPos);
    header = sepPos == std::string_view::npos ? std::string_view{} : header.substr(sepPos + 1);

    if (TrimOws(pair).empty()) {
      continue;
    }
    const auto eqPos = pair.find('=');
    std::string name = DecodeCookieToken(pair.substr(0, eqPos));
    std::string value = eqPos == std::string_view::npos ? std::string{} : DecodeCookieToken(pair.substr(eqPos + 1));
    jar._cookies[std::move(name)].push_back(std::move(value));
  }
  return jar;
}

std::optional<std::string_view> CookieJar::first(std::string_view name) const {
  const auto it = _cookies.find(name);
  if (it == _cookies.end() || it->second.empty()) {
    return std::nullopt;
  }
  return std::string_view(it->second.front());
}

std::span<const std::string> CookieJar::all(std::string_view name) const {
  const auto it = _cookies.find(name);
  if (it == _cookies.end()) {
    return {};
  }
  return {it->second.data(), it->second.size()};
}

std::string FormatCookie(std::string_view name, std::string_view value, const CookieOptions& options) {
  std::string cookie = url::EncodeComponent(name);
  cookie.push_back('=');
  cookie.append(url::EncodeComponent(value));
  if (!options.domain.empty()) {
    cookie.append("; domain=").append(options.domain);
  }
  if (!options.path.empty()) {
    cookie.append("; path=").append(options.path);
  }
  if (options.expires) {
    cookie.append("; expires=").append(RFC7231String(*options.expires));
  }
  if (options.secure) {
    cookie.append("; secure");
  }
  if (options.httpOnly) {
    cookie.append("; HttpOnly");
  }
  return cookie;
}

}  // namespace trellis

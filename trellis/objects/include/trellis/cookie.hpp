#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "trellis/timedef.hpp"
#include "trellis/vector.hpp"

namespace trellis {

/// Attributes appended to a 'set-cookie' value by FormatCookie.
struct CookieOptions {
  std::string domain;
  std::string path;
  std::optional<SysTimePoint> expires;
  bool secure{false};
  bool httpOnly{false};
};

/// Decoded cookies of a 'cookie' request header. A name may appear several times, values keep their order.
class CookieJar {
 public:
  CookieJar() noexcept = default;

  /// Parses a 'cookie' header value. Pairs are separated by ';' or ',', names and values are trimmed and
  /// percent-decoded ('+' decodes to a space). A pair without '=' yields an empty value.
  static CookieJar Parse(std::string_view header);

  [[nodiscard]] bool contains(std::string_view name) const { return _cookies.contains(name); }

  /// First value of given cookie, if any.
  [[nodiscard]] std::optional<std::string_view> first(std::string_view name) const;

  /// All values of given cookie, in header order (empty if absent).
  [[nodiscard]] std::span<const std::string> all(std::string_view name) const;

  [[nodiscard]] std::size_t size() const noexcept { return _cookies.size(); }

 private:
  std::map<std::string, vector<std::string>, std::less<>> _cookies;
};

/// Formats a 'set-cookie' header value: "<encoded name>=<encoded value>[; domain=...][; path=...]
/// [; expires=<IMF-fixdate>][; secure][; HttpOnly]".
std::string FormatCookie(std::string_view name, std::string_view value, const CookieOptions& options = {});

}  // namespace trellis

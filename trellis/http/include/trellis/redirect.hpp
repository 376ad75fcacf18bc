#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "trellis/app.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"

namespace trellis {

// Flavor of a redirect, used to pick its default status.
enum class RedirectKind : std::uint8_t { Unspecified, Permanent, Temporary };

// Status of a redirect, by decreasing precedence:
//  - 'explicitStatus' when given
//  - 301 when the request is flagged permanent
//  - 301 for RedirectKind::Permanent, 307 for RedirectKind::Temporary
//  - 307 otherwise
[[nodiscard]] http::StatusCode ResolveRedirectStatus(std::optional<http::StatusCode> explicitStatus,
                                                     bool requestPermanent, RedirectKind kind) noexcept;

// Escapes '&', '<', '>', '"' and '\'' for inclusion in HTML text or attribute values.
[[nodiscard]] std::string HtmlEscape(std::string_view text);

// Redirect response to 'location', resolved against the request path.
// The response carries the Location header and a short text/html body linking to it.
// With 'tree', the remaining path of the request (pathInfo without its leading '/') is resolved against the
// location, so that a whole subtree is redirected.
HttpResponse redirect(const HttpRequest& request, std::string_view location,
                      std::optional<http::StatusCode> status = {}, bool tree = false);

HttpResponse permanentRedirect(const HttpRequest& request, std::string_view location,
                               std::optional<http::StatusCode> status = {});

HttpResponse temporaryRedirect(const HttpRequest& request, std::string_view location,
                               std::optional<http::StatusCode> status = {});

HttpResponse redirectTree(const HttpRequest& request, std::string_view location,
                          std::optional<http::StatusCode> status = {});

HttpResponse permanentRedirectTree(const HttpRequest& request, std::string_view location,
                                   std::optional<http::StatusCode> status = {});

HttpResponse temporaryRedirectTree(const HttpRequest& request, std::string_view location,
                                   std::optional<http::StatusCode> status = {});

// App versions of the functions above, redirecting every request to 'location'.
App Redirect(std::string location, std::optional<http::StatusCode> status = {});
App RedirectTree(std::string location, std::optional<http::StatusCode> status = {});
App PermanentRedirect(std::string location, std::optional<http::StatusCode> status = {});
App PermanentRedirectTree(std::string location, std::optional<http::StatusCode> status = {});
App TemporaryRedirect(std::string location, std::optional<http::StatusCode> status = {});
App TemporaryRedirectTree(std::string location, std::optional<http::StatusCode> status = {});

}  // namespace trellis

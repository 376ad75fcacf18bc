#include "trellis/redirect.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/app.hpp"
#include "trellis/http-constants.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/task.hpp"
#include "trellis/url-resolve.hpp"

namespace trellis {

namespace {

HttpResponse BuildRedirect(const HttpRequest& request, std::string_view location,
                           std::optional<http::StatusCode> status, bool tree, RedirectKind kind) {
  std::string target = url::Resolve(request.path(), location);
  if (tree) {
    std::string_view remaining = request.pathInfo();
    if (remaining.starts_with('/')) {
      remaining.remove_prefix(1);
    }
    target = url::Resolve(target, remaining);
  }

  const std::string escaped = HtmlEscape(target);
  std::string body("Go to <a href=\"");
  body.append(escaped);
  body.append("\">");
  body.append(escaped);
  body.append("</a>");

  return HttpResponse(ResolveRedirectStatus(status, request.permanent(), kind))
      .location(target)
      .body(std::move(body), http::ContentTypeTextHtml);
}

Task<HttpResponse> RedirectApp(std::string location, std::optional<http::StatusCode> status, bool tree,
                               RedirectKind kind, HttpRequest request) {
  co_return BuildRedirect(request, location, status, tree, kind);
}

App MakeRedirectApp(std::string location, std::optional<http::StatusCode> status, bool tree, RedirectKind kind) {
  return [location = std::move(location), status, tree, kind](HttpRequest request) {
    return RedirectApp(location, status, tree, kind, std::move(request));
  };
}

}  // namespace

http::StatusCode ResolveRedirectStatus(std::optional<http::StatusCode> explicitStatus, bool requestPermanent,
                                       RedirectKind kind) noexcept {
  if (explicitStatus) {
    return *explicitStatus;
  }
  if (requestPermanent) {
    return http::StatusCodeMovedPermanently;
  }
  switch (kind) {
    case RedirectKind::Permanent:
      return http::StatusCodeMovedPermanently;
    case RedirectKind::Temporary:
      [[fallthrough]];
    default:
      return http::StatusCodeTemporaryRedirect;
  }
}

std::string HtmlEscape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char ch : text) {
    switch (ch) {
      case '&':
        out.append("&amp;");
        break;
      case '<':
        out.append("&lt;");
        break;
      case '>':
        out.append("&gt;");
        break;
      case '"':
        out.append("&quot;");
        break;
      case '\'':
        out.append("&#39;");
        break;
      default:
        out.push_back(ch);
        break;
    }
  }
  return out;
}

HttpResponse redirect(const HttpRequest& request, std::string_view location, std::optional<http::StatusCode> status,
                      bool tree) {
  return BuildRedirect(request, location, status, tree, RedirectKind::Unspecified);
}

HttpResponse permanentRedirect(const HttpRequest& request, std::string_view location,
                               std::optional<http::StatusCode> status) {
  return BuildRedirect(request, location, status, false, RedirectKind::Permanent);
}

HttpResponse temporaryRedirect(const HttpRequest& request, std::string_view location,
                               std::optional<http::StatusCode> status) {
  return BuildRedirect(request, location, status, false, RedirectKind::Temporary);
}

HttpResponse redirectTree(const HttpRequest& request, std::string_view location,
                          std::optional<http::StatusCode> status) {
  return BuildRedirect(request, location, status, true, RedirectKind::Unspecified);
}

HttpResponse permanentRedirectTree(const HttpRequest& request, std::string_view location,
                                   std::optional<http::StatusCode> status) {
  return BuildRedirect(request, location, status, true, RedirectKind::Permanent);
}

HttpResponse temporaryRedirectTree(const HttpRequest& request, std::string_view location,
                                   std::optional<http::StatusCode> status) {
  return BuildRedirect(request, location, status, true, RedirectKind::Temporary);
}

App Redirect(std::string location, std::optional<http::StatusCode> status) {
  return MakeRedirectApp(std::move(location), status, false, RedirectKind::Unspecified);
}

App RedirectTree(std::string location, std::optional<http::StatusCode> status) {
  return MakeRedirectApp(std::move(location), status, true, RedirectKind::Unspecified);
}

App PermanentRedirect(std::string location, std::optional<http::StatusCode> status) {
  return MakeRedirectApp(std::move(location), status, false, RedirectKind::Permanent);
}

App PermanentRedirectTree(std::string location, std::optional<http::StatusCode> status) {
  return MakeRedirectApp(std::move(location), status, true, RedirectKind::Permanent);
}

App TemporaryRedirect(std::string location, std::optional<http::StatusCode> status) {
  return MakeRedirectApp(std::move(location), status, false, RedirectKind::Temporary);
}

App TemporaryRedirectTree(std::string location, std::optional<http::StatusCode> status) {
  return MakeRedirectApp(std::move(location), status, true, RedirectKind::Temporary);
}

}  // namespace trellis

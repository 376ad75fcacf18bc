#include "trellis/sessions.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/app.hpp"
#include "trellis/cookie.hpp"
#include "trellis/http-constants.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/log.hpp"
#include "trellis/redirect.hpp"
#include "trellis/response-builders.hpp"
#include "trellis/session-store.hpp"
#include "trellis/task.hpp"
#include "trellis/timestring.hpp"

namespace trellis {

namespace {

constexpr std::string_view kCookieCheckPath = "/~session/";

struct SessionInfo {
  std::string id;
  std::string lastAccess;
};

struct SessionRouter {
  SessionFactory factory;
  std::shared_ptr<SessionStore> store;
};

Task<HttpResponse> RouteToSession(std::shared_ptr<Session> session, std::shared_ptr<SessionStore> store,
                                  HttpRequest request) {
  session->lastAccess = store->now();
  request.session(session);
  co_return co_await session->route(std::move(request));
}

Task<HttpResponse> CookieSessionApp(std::shared_ptr<const SessionRouter> router, HttpRequest request) {
  const CookieJar cookies = CookieJar::Parse(request.headerValueOrEmpty(http::Cookie));
  // Stale cookies set for other paths may precede the live one.
  const auto sessionIds = cookies.all(kSessionCookieName);

  if (request.pathInfo().starts_with(kCookieCheckPath)) {
    if (!sessionIds.empty()) {
      co_return temporaryRedirect(request, "../");
    }
    co_return HttpResponse(http::StatusCodeNotFound).body("Access requires cookies", http::ContentTypeTextPlain);
  }

  for (const std::string& sessionId : sessionIds) {
    if (auto session = router->store->get(sessionId)) {
      co_return co_await RouteToSession(std::move(session), router->store, std::move(request));
    }
  }
  if (!sessionIds.empty()) {
    log::debug("No live session among {} session cookie(s), creating a new one", sessionIds.size());
  }

  const auto session = router->store->create(router->factory);
  std::string scriptName(request.scriptName());
  HttpResponse response = temporaryRedirect(request, scriptName + "~session/");
  CookieOptions options;
  options.path = std::move(scriptName);
  response.header(http::SetCookie, FormatCookie(kSessionCookieName, session->id, options));
  co_return response;
}

Task<HttpResponse> PathSessionApp(std::shared_ptr<const SessionRouter> router, HttpRequest request) {
  if (request.pathInfo() == "/") {
    const auto session = router->store->create(router->factory);
    co_return json(SessionInfo{session->id, ISO8601String(session->lastAccess)});
  }
  const std::string sessionId(request.nextSegment());
  auto session = sessionId.empty() ? nullptr : router->store->get(sessionId);
  if (!session) {
    co_return responseForStatus(http::StatusCodeNotFound, "Session does not exist");
  }
  request.consumeSegment(sessionId);
  co_return co_await RouteToSession(std::move(session), router->store, std::move(request));
}

App MakeSessionRouter(SessionFactory factory, std::shared_ptr<SessionStore> store,
                      Task<HttpResponse> (*routerApp)(std::shared_ptr<const SessionRouter>, HttpRequest)) {
  if (!factory || !store) {
    throw std::invalid_argument("Session routers require a factory and a store");
  }
  auto router = std::make_shared<const SessionRouter>(std::move(factory), std::move(store));
  return [router = std::move(router), routerApp](HttpRequest request) { return routerApp(router, std::move(request)); };
}

}  // namespace

App CookieSession(SessionFactory factory, std::shared_ptr<SessionStore> store) {
  return MakeSessionRouter(std::move(factory), std::move(store), CookieSessionApp);
}

App PathSession(SessionFactory factory, std::shared_ptr<SessionStore> store) {
  return MakeSessionRouter(std::move(factory), std::move(store), PathSessionApp);
}

}  // namespace trellis

#include "trellis/routing.hpp"

#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/app.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/log.hpp"
#include "trellis/response-builders.hpp"
#include "trellis/task.hpp"
#include "trellis/url-decode.hpp"
#include "trellis/vector.hpp"

namespace trellis {

namespace {

App OrDefault(App app, App (*defaultApp)()) {
  if (!app) {
    return defaultApp();
  }
  return app;
}

Task<HttpResponse> BranchApp(std::shared_ptr<const RouteTable> routes, App notFound, HttpRequest request) {
  if (!request.pathInfo().starts_with('/')) {
    co_return co_await notFound(std::move(request));
  }
  const std::string rawSegment(request.nextSegment());
  const auto segment = url::DecodeComponent(rawSegment);
  const App* app = segment ? routes->lookup(*segment) : nullptr;
  if (app == nullptr) {
    co_return co_await notFound(std::move(request));
  }
  request.consumeSegment(rawSegment);
  co_return co_await (*app)(std::move(request));
}

Task<HttpResponse> CapApp(App app, App notFound, HttpRequest request) {
  const std::string_view pathInfo = request.pathInfo();
  if (pathInfo.empty() || pathInfo == "/") {
    co_return co_await app(std::move(request));
  }
  co_return co_await notFound(std::move(request));
}

Task<HttpResponse> MethodApp(std::shared_ptr<const RouteTable> methods, App methodNotAllowed, HttpRequest request) {
  const App* app = methods->lookup(request.method());
  if (app == nullptr) {
    co_return co_await methodNotAllowed(std::move(request));
  }
  co_return co_await (*app)(std::move(request));
}

Task<HttpResponse> FirstFoundApp(std::shared_ptr<const vector<App>> apps, HttpRequest request) {
  std::optional<HttpResponse> response;
  for (const App& app : *apps) {
    response = co_await app(request);
    if (response->status() != http::StatusCodeNotFound) {
      break;
    }
    log::debug("FirstFound: 404 for '{}', trying next app", request.path());
  }
  co_return std::move(*response);
}

Task<HttpResponse> SelectApp(std::shared_ptr<const Selector> selector, HttpRequest request) {
  App app = co_await (*selector)(request);
  if (!app) {
    throw std::runtime_error("Selector produced an empty App");
  }
  co_return co_await app(std::move(request));
}

}  // namespace

RouteTable::RouteTable(std::initializer_list<value_type> routes) {
  for (const auto& [key, app] : routes) {
    add(key, app);
  }
}

RouteTable& RouteTable::add(std::string_view key, App app) {
  for (auto& route : _routes) {
    if (route.first == key) {
      route.second = std::move(app);
      return *this;
    }
  }
  _routes.emplace_back(std::string(key), std::move(app));
  return *this;
}

const App* RouteTable::lookup(std::string_view key) const noexcept {
  for (const auto& route : _routes) {
    if (route.first == key) {
      return &route.second;
    }
  }
  return nullptr;
}

App Branch(RouteTable routes, App notFound) {
  auto sharedRoutes = std::make_shared<const RouteTable>(std::move(routes));
  notFound = OrDefault(std::move(notFound), trellis::notFound);
  return [routes = std::move(sharedRoutes), notFound = std::move(notFound)](HttpRequest request) {
    return BranchApp(routes, notFound, std::move(request));
  };
}

App End(App app, App notFound) { return Branch(RouteTable{{"", std::move(app)}}, std::move(notFound)); }

App Cap(App app, App notFound) {
  notFound = OrDefault(std::move(notFound), trellis::notFound);
  return [app = std::move(app), notFound = std::move(notFound)](HttpRequest request) {
    return CapApp(app, notFound, std::move(request));
  };
}

App Method(RouteTable methods, App methodNotAllowed) {
  auto sharedMethods = std::make_shared<const RouteTable>(std::move(methods));
  methodNotAllowed = OrDefault(std::move(methodNotAllowed), trellis::methodNotAllowed);
  return [methods = std::move(sharedMethods), methodNotAllowed = std::move(methodNotAllowed)](HttpRequest request) {
    return MethodApp(methods, methodNotAllowed, std::move(request));
  };
}

App FirstFound(vector<App> apps) {
  if (apps.empty()) {
    throw std::invalid_argument("FirstFound requires at least one app");
  }
  auto sharedApps = std::make_shared<const vector<App>>(std::move(apps));
  return [apps = std::move(sharedApps)](HttpRequest request) { return FirstFoundApp(apps, std::move(request)); };
}

App Select(Selector selector) {
  auto sharedSelector = std::make_shared<const Selector>(std::move(selector));
  return [selector = std::move(sharedSelector)](HttpRequest request) {
    return SelectApp(selector, std::move(request));
  };
}

}  // namespace trellis

#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/app.hpp"
#include "trellis/http-request.hpp"
#include "trellis/task.hpp"
#include "trellis/vector.hpp"

namespace trellis {

// Ordered association list from a key (path segment, method name...) to an App.
class RouteTable {
 public:
  using value_type = std::pair<std::string, App>;

  RouteTable() noexcept = default;

  RouteTable(std::initializer_list<value_type> routes);

  // Associates 'app' to 'key', replacing any previous association.
  RouteTable& add(std::string_view key, App app);

  // App associated to 'key', nullptr if none.
  [[nodiscard]] const App* lookup(std::string_view key) const noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return _routes.size(); }
  [[nodiscard]] bool empty() const noexcept { return _routes.empty(); }

  [[nodiscard]] auto begin() const noexcept { return _routes.begin(); }
  [[nodiscard]] auto end() const noexcept { return _routes.end(); }

 private:
  vector<value_type> _routes;
};

// Routes on the next segment of pathInfo.
// The segment is percent-decoded before lookup, and on a match it is moved from pathInfo to scriptName:
//   Branch({{"foo", app}}) on "/foo/bar" calls app with scriptName "/foo/" and pathInfo "/bar".
// A pathInfo not starting with '/', a malformed escape or an unknown segment is answered by 'notFound'.
App Branch(RouteTable routes, App notFound = {});

// Branch({{"", app}}, notFound): matches only when the remaining path is "/" (or "/" followed by more segments).
App End(App app, App notFound = {});

// Calls 'app' only when the remaining path is empty or "/", 'notFound' otherwise.
App Cap(App app, App notFound = {});

// Dispatches on the request method (exact, case-sensitive match), 'methodNotAllowed' answers the others.
App Method(RouteTable methods, App methodNotAllowed = {});

// Tries each app in order on the same request and returns the first response whose status is not 404, or the last
// response if all of them answered 404. Throws std::invalid_argument if 'apps' is empty.
App FirstFound(vector<App> apps);

// Resolves the App to use for each request, possibly asynchronously.
using Selector = std::function<Task<App>(const HttpRequest&)>;

// Awaits 'selector' and forwards the request to the App it produced.
App Select(Selector selector);

}  // namespace trellis

#pragma once

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string_view>
#include <utility>

#include "trellis/app.hpp"
#include "trellis/headers-map.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/timedef.hpp"
#include "trellis/vector.hpp"

namespace trellis {

// Result of a Tap function.
class TapResult {
 public:
  enum class Decision : std::uint8_t { Continue, ShortCircuit };

  // Default to Continue.
  TapResult() noexcept = default;

  // Short-circuits the decorated app with given response.
  explicit TapResult(HttpResponse response) noexcept
      : _decision(Decision::ShortCircuit), _response(std::move(response)) {}

  static TapResult Continue() noexcept { return {}; }

  static TapResult ShortCircuit(HttpResponse response) noexcept { return TapResult(std::move(response)); }

  [[nodiscard]] bool shouldContinue() const noexcept { return _decision == Decision::Continue; }

  [[nodiscard]] bool shouldShortCircuit() const noexcept { return _decision == Decision::ShortCircuit; }

  [[nodiscard]] HttpResponse&& takeResponse() && noexcept { return std::move(_response); }

 private:
  Decision _decision{Decision::Continue};
  HttpResponse _response;
};

// Invoked before the decorated app. It may alter the request and short-circuit the app.
using TapFunction = std::function<TapResult(HttpRequest&)>;

// Invoked with the response of the decorated app (and the request it was given). It can amend or replace it.
using TrapFunction = std::function<void(const HttpRequest&, HttpResponse&)>;

// Runs 'tap' before 'app', 'app' is not called if 'tap' short-circuits.
App Tap(App app, TapFunction tap);

// Runs 'trap' on the response of 'app'.
App Trap(App app, TrapFunction trap);

// Converts failures (std::exception) of 'app' into 500 responses. The failure message is only disclosed in the
// response body when 'debug' is true.
App Error(App app, bool debug = false);

struct LogConfig {
  // Receives each access line. Defaults to log::info.
  std::function<void(std::string_view)> sink;

  // Time stamped at the beginning of each line. Defaults to the system clock.
  PresentFunction clock;
};

// Access log. For each request, emits a line when it is received and another one when it is answered (status and
// content length) or failed (failure message). Failures are rethrown unchanged.
App Log(App app, LogConfig config = {});

// Sets 'x-response-time' to the number of milliseconds taken by 'app' to produce its response, body streaming
// excluded.
App Time(App app);

// Adds 'headers' to the responses of 'app', headers already set by 'app' take precedence.
App Headers(App app, HeadersMap headers);

// Sets the 'date' header of responses.
App Date(App app, PresentFunction present = {});

// Flags requests as permanent (redirects then default to 301) and sets 'expires' to 'future()' on responses.
// 'future' defaults to ten years from now.
App Permanent(App app, PresentFunction future = {});

// Sets 'content-length' on responses having neither 'content-length' nor 'transfer-encoding'. The body is read
// in memory to measure it.
App ContentLength(App app);

// Decorator forms of the functions above, to be composed with Decorators.
Decorator WithTap(TapFunction tap);
Decorator WithTrap(TrapFunction trap);
Decorator WithError(bool debug = false);
Decorator WithLog(LogConfig config = {});
Decorator WithTime();
Decorator WithHeaders(HeadersMap headers);
Decorator WithDate(PresentFunction present = {});
Decorator WithPermanent(PresentFunction future = {});
Decorator WithContentLength();

// Applies 'decorators' to 'app', the first decorator being the outermost one:
//   Decorators({WithLog(), WithError()}, app) is equivalent to Log(Error(app)).
App Decorators(std::initializer_list<Decorator> decorators, App app);
App Decorators(const vector<Decorator>& decorators, App app);

}  // namespace trellis

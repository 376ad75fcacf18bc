#include "trellis/decorators.hpp"

#include <chrono>
#include <exception>
#include <format>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/app.hpp"
#include "trellis/headers-map.hpp"
#include "trellis/http-body.hpp"
#include "trellis/http-constants.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/log.hpp"
#include "trellis/response-builders.hpp"
#include "trellis/task.hpp"
#include "trellis/timedef.hpp"
#include "trellis/timestring.hpp"
#include "trellis/vector.hpp"

namespace trellis {

namespace {

constexpr auto kDefaultPermanentDuration = std::chrono::days{3650};

Task<HttpResponse> TapApp(App app, TapFunction tap, HttpRequest request) {
  TapResult result = tap(request);
  if (result.shouldShortCircuit()) {
    co_return std::move(result).takeResponse();
  }
  co_return co_await app(std::move(request));
}

Task<HttpResponse> TrapApp(App app, TrapFunction trap, HttpRequest request) {
  HttpResponse response = co_await app(request);
  trap(request, response);
  co_return response;
}

Task<HttpResponse> ErrorApp(App app, bool debug, HttpRequest request) {
  const std::string requestLine = std::format("{} {}", request.method(), request.path());
  std::string failure;
  try {
    co_return co_await app(std::move(request));
  } catch (const std::exception& ex) {
    log::error("Failure while handling '{}': {}", requestLine, ex.what());
    failure = ex.what();
  } catch (...) {
    log::error("Unknown failure while handling '{}'", requestLine);
    failure = "unknown failure";
  }
  co_return debug ? responseForStatus(http::StatusCodeInternalServerError, failure)
                  : responseForStatus(http::StatusCodeInternalServerError);
}

struct AccessLog {
  LogConfig config;

  void emit(std::string_view message) const {
    std::string line = ISO8601String(config.clock());
    line.push_back(' ');
    line.append(message);
    config.sink(line);
  }
};

Task<HttpResponse> LogApp(App app, std::shared_ptr<const AccessLog> accessLog, HttpRequest request) {
  const std::string remoteHost = std::format("{}:{}", request.remoteHost(), request.remotePort());
  const std::string requestLine = std::format("{} {} HTTP/{}.{}", request.method(), request.path(),
                                              request.versionMajor(), request.versionMinor());
  accessLog->emit(std::format("{} -->     {}", remoteHost, requestLine));

  std::optional<HttpResponse> response;
  try {
    response.emplace(co_await app(std::move(request)));
  } catch (const std::exception& ex) {
    accessLog->emit(std::format("{} !!!     {} {}", remoteHost, requestLine, ex.what()));
    throw;
  } catch (...) {
    accessLog->emit(std::format("{} !!!     {} unknown failure", remoteHost, requestLine));
    throw;
  }

  const auto contentLength = response->headerValue(http::ContentLength);
  if (response->body().isStream() && !contentLength && !response->body().knownSize()) {
    accessLog->emit(std::format("{} ... ... {} (response undefined / presumed streaming)", remoteHost, requestLine));
  } else {
    accessLog->emit(std::format("{} <== {} {} {}", remoteHost, response->status(), requestLine,
                                contentLength.value_or("-")));
  }
  co_return std::move(*response);
}

Task<HttpResponse> TimeApp(App app, HttpRequest request) {
  const auto start = SteadyClock::now();
  HttpResponse response = co_await app(std::move(request));
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);
  response.header(http::XResponseTime, elapsed.count());
  co_return response;
}

Task<HttpResponse> ContentLengthApp(App app, HttpRequest request) {
  HttpResponse response = co_await app(std::move(request));
  if (http::IsBodilessStatus(response.status()) || response.headerValue(http::ContentLength) ||
      response.headerValue(http::TransferEncoding)) {
    co_return response;
  }
  std::string content = co_await response.body().readAll();
  response.header(http::ContentLength, content.size());
  response.body(HttpBody(std::move(content)));
  co_return response;
}

SysTimePoint DefaultFuture() { return SysClock::now() + kDefaultPermanentDuration; }

SysTimePoint Now() { return SysClock::now(); }

}  // namespace

App Tap(App app, TapFunction tap) {
  return [app = std::move(app), tap = std::move(tap)](HttpRequest request) {
    return TapApp(app, tap, std::move(request));
  };
}

App Trap(App app, TrapFunction trap) {
  return [app = std::move(app), trap = std::move(trap)](HttpRequest request) {
    return TrapApp(app, trap, std::move(request));
  };
}

App Error(App app, bool debug) {
  return [app = std::move(app), debug](HttpRequest request) { return ErrorApp(app, debug, std::move(request)); };
}

App Log(App app, LogConfig config) {
  if (!config.sink) {
    config.sink = [](std::string_view line) { log::info("{}", line); };
  }
  if (!config.clock) {
    config.clock = Now;
  }
  auto accessLog = std::make_shared<const AccessLog>(std::move(config));
  return [app = std::move(app), accessLog = std::move(accessLog)](HttpRequest request) {
    return LogApp(app, accessLog, std::move(request));
  };
}

App Time(App app) {
  return [app = std::move(app)](HttpRequest request) { return TimeApp(app, std::move(request)); };
}

App Headers(App app, HeadersMap headers) {
  return Trap(std::move(app), [headers = std::move(headers)](const HttpRequest&, HttpResponse& response) {
    for (const auto& [name, value] : headers) {
      response.headerIfAbsent(name, value);
    }
  });
}

App Date(App app, PresentFunction present) {
  if (!present) {
    present = Now;
  }
  return Trap(std::move(app), [present = std::move(present)](const HttpRequest&, HttpResponse& response) {
    response.header(http::Date, RFC7231String(present()));
  });
}

App Permanent(App app, PresentFunction future) {
  if (!future) {
    future = DefaultFuture;
  }
  App expiring = Trap(std::move(app), [future = std::move(future)](const HttpRequest&, HttpResponse& response) {
    response.header(http::Expires, RFC7231String(future()));
  });
  return Tap(std::move(expiring), [](HttpRequest& request) {
    request.permanent(true);
    return TapResult::Continue();
  });
}

App ContentLength(App app) {
  return [app = std::move(app)](HttpRequest request) { return ContentLengthApp(app, std::move(request)); };
}

Decorator WithTap(TapFunction tap) {
  return [tap = std::move(tap)](App app) { return Tap(std::move(app), tap); };
}

Decorator WithTrap(TrapFunction trap) {
  return [trap = std::move(trap)](App app) { return Trap(std::move(app), trap); };
}

Decorator WithError(bool debug) {
  return [debug](App app) { return Error(std::move(app), debug); };
}

Decorator WithLog(LogConfig config) {
  return [config = std::move(config)](App app) { return Log(std::move(app), config); };
}

Decorator WithTime() { return Time; }

Decorator WithHeaders(HeadersMap headers) {
  return [headers = std::move(headers)](App app) { return Headers(std::move(app), headers); };
}

Decorator WithDate(PresentFunction present) {
  return [present = std::move(present)](App app) { return Date(std::move(app), present); };
}

Decorator WithPermanent(PresentFunction future) {
  return [future = std::move(future)](App app) { return Permanent(std::move(app), future); };
}

Decorator WithContentLength() { return ContentLength; }

App Decorators(const vector<Decorator>& decorators, App app) {
  for (auto it = decorators.rbegin(); it != decorators.rend(); ++it) {
    app = (*it)(std::move(app));
  }
  return app;
}

App Decorators(std::initializer_list<Decorator> decorators, App app) {
  for (auto it = std::rbegin(decorators); it != std::rend(decorators); ++it) {
    app = (*it)(std::move(app));
  }
  return app;
}

}  // namespace trellis

#include "trellis/negotiators.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/app.hpp"
#include "trellis/http-constants.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/log.hpp"
#include "trellis/negotiation.hpp"
#include "trellis/response-builders.hpp"
#include "trellis/routing.hpp"
#include "trellis/task.hpp"
#include "trellis/vector.hpp"

namespace trellis {

namespace {

using Annotator = void (*)(HttpResponse&, std::string_view);

struct Negotiator {
  RouteTable routes;
  vector<std::string_view> keys;
  App notAcceptable;
  HeaderFunction header;
  std::string_view termName;
  NegotiationKind kind;
  Annotator annotate;
};

void AnnotateContentType(HttpResponse& response, std::string_view value) {
  response.header(http::ContentType, value);
}

void AnnotateLanguage(HttpResponse& response, std::string_view value) {
  response.header(http::ContentLanguage, value);
}

void AnnotateCharset(HttpResponse& response, std::string_view value) {
  std::string contentType(response.headerValue(http::ContentType).value_or(http::ContentTypeTextPlain));
  contentType.append("; charset=");
  contentType.append(value);
  response.header(http::ContentType, contentType);
}

void AnnotateEncoding(HttpResponse& response, std::string_view value) {
  response.header(http::ContentEncoding, value);
}

HeaderFunction RequestHeader(std::string_view name) {
  return [name](const HttpRequest& request) { return std::string(request.headerValueOrEmpty(name)); };
}

Task<HttpResponse> NegotiateApp(std::shared_ptr<const Negotiator> negotiator, HttpRequest request) {
  const std::string preferences = negotiator->header(request);
  const std::span<const std::string_view> candidates(negotiator->keys.data(), negotiator->keys.size());
  const auto bestPos = BestMatch(candidates, preferences, negotiator->kind);
  if (!bestPos) {
    log::debug("No acceptable {} for '{}' among {} candidates", negotiator->termName, preferences,
               negotiator->keys.size());
    co_return co_await negotiator->notAcceptable(std::move(request));
  }
  const auto& [value, app] = *(negotiator->routes.begin() + static_cast<std::ptrdiff_t>(*bestPos));
  request.term(negotiator->termName, value);
  HttpResponse response = co_await app(std::move(request));
  if (negotiator->annotate != nullptr && response.status() == http::StatusCodeOK) {
    negotiator->annotate(response, value);
  }
  co_return response;
}

App MakeNegotiator(RouteTable routes, App notAcceptable, HeaderFunction header, std::string_view defaultHeaderName,
                   std::string_view termName, NegotiationKind kind, Annotator annotate) {
  auto negotiator = std::make_shared<Negotiator>();
  negotiator->routes = std::move(routes);
  for (const auto& route : negotiator->routes) {
    negotiator->keys.emplace_back(route.first);
  }
  negotiator->notAcceptable = notAcceptable ? std::move(notAcceptable) : trellis::notAcceptable();
  negotiator->header = header ? std::move(header) : RequestHeader(defaultHeaderName);
  negotiator->termName = termName;
  negotiator->kind = kind;
  negotiator->annotate = annotate;
  return [negotiator = std::shared_ptr<const Negotiator>(std::move(negotiator))](HttpRequest request) {
    return NegotiateApp(negotiator, std::move(request));
  };
}

}  // namespace

std::string HostWithPort(const HttpRequest& request) {
  std::string host(request.headerValue(http::Host).value_or("*"));
  // the port separator is the last ':' after any IPv6 literal
  const auto closingBracketPos = host.rfind(']');
  const auto colonPos = host.rfind(':');
  const bool hasPort = colonPos != std::string::npos &&
                       (closingBracketPos == std::string::npos || colonPos > closingBracketPos);
  if (!hasPort) {
    host.push_back(':');
    host.append(std::to_string(request.serverPort()));
  }
  return host;
}

App ContentType(RouteTable types, App notAcceptable, HeaderFunction header) {
  return MakeNegotiator(std::move(types), std::move(notAcceptable), std::move(header), http::Accept, "content-type",
                        NegotiationKind::MediaType, AnnotateContentType);
}

App Language(RouteTable languages, App notAcceptable, HeaderFunction header) {
  return MakeNegotiator(std::move(languages), std::move(notAcceptable), std::move(header), http::AcceptLanguage,
                        "language", NegotiationKind::Language, AnnotateLanguage);
}

App Charset(RouteTable charsets, App notAcceptable, HeaderFunction header) {
  return MakeNegotiator(std::move(charsets), std::move(notAcceptable), std::move(header), http::AcceptCharset,
                        "charset", NegotiationKind::Charset, AnnotateCharset);
}

App Encoding(RouteTable encodings, App notAcceptable, HeaderFunction header) {
  return MakeNegotiator(std::move(encodings), std::move(notAcceptable), std::move(header), http::AcceptEncoding,
                        "encoding", NegotiationKind::Encoding, AnnotateEncoding);
}

App Host(RouteTable hosts, App notAcceptable, HeaderFunction header) {
  if (!header) {
    header = HostWithPort;
  }
  return MakeNegotiator(std::move(hosts), std::move(notAcceptable), std::move(header), http::Host, "host",
                        NegotiationKind::Host, nullptr);
}

}  // namespace trellis

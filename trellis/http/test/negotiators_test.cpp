#include "trellis/negotiators.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "trellis/app-test-helpers.hpp"
#include "trellis/app.hpp"
#include "trellis/http-constants.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/response-builders.hpp"
#include "trellis/routing.hpp"
#include "trellis/task.hpp"

namespace trellis {

namespace {

Task<HttpResponse> RespondTerm(std::string name, HttpRequest request) {
  co_return ok(std::string(request.term(name).value_or("<none>")));
}

// App answering the value of the negotiated term 'name'.
App TermEcho(std::string name) {
  return [name = std::move(name)](HttpRequest request) { return RespondTerm(name, std::move(request)); };
}

}  // namespace

TEST(ContentTypeNegotiator, PicksHighestQuality) {
  App app = ContentType({{"text/html", TermEcho("content-type")}, {"application/json", TermEcho("content-type")}});

  HttpResponse response = test::Run(app, test::Get("/", {{"accept", "text/html;q=0.5, application/json"}}));
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.headerValueOrEmpty(http::ContentType), "application/json");
  EXPECT_EQ(test::BodyOf(response), "application/json");

  response = test::Run(app, test::Get("/", {{"accept", "text/*"}}));
  EXPECT_EQ(response.headerValueOrEmpty(http::ContentType), "text/html");
}

TEST(ContentTypeNegotiator, MissingHeaderPicksFirst) {
  App app = ContentType({{"text/html", TermEcho("content-type")}, {"application/json", TermEcho("content-type")}});
  HttpResponse response = test::Run(app, test::Get("/"));
  EXPECT_EQ(response.headerValueOrEmpty(http::ContentType), "text/html");
  EXPECT_EQ(test::BodyOf(response), "text/html");
}

TEST(ContentTypeNegotiator, NotAcceptable) {
  App app = ContentType({{"text/html", TermEcho("content-type")}});
  HttpResponse response = test::Run(app, test::Get("/page", {{"accept", "image/png, text/html;q=0"}}));
  EXPECT_EQ(response.status(), http::StatusCodeNotAcceptable);
  EXPECT_EQ(test::BodyOf(response), "Not Acceptable: GET /page\r\n");

  App custom = ContentType({{"text/html", TermEcho("content-type")}}, test::Respond(http::StatusCodeGone));
  EXPECT_EQ(test::Run(custom, test::Get("/", {{"accept", "image/png"}})).status(), http::StatusCodeGone);
}

TEST(ContentTypeNegotiator, OnlyAnnotatesSuccessfulResponses) {
  App app = ContentType({{"application/json", test::Respond(http::StatusCodeNotFound, "missing")}});
  HttpResponse response = test::Run(app, test::Get("/", {{"accept", "application/json"}}));
  EXPECT_EQ(response.status(), http::StatusCodeNotFound);
  EXPECT_EQ(response.headerValueOrEmpty(http::ContentType), http::ContentTypeTextPlain);
}

TEST(ContentTypeNegotiator, CustomHeaderFunction) {
  App app = ContentType({{"text/html", TermEcho("content-type")}, {"application/json", TermEcho("content-type")}}, {},
                        [](const HttpRequest& request) { return std::string(request.query()); });
  HttpResponse response = test::Run(app, test::Get("/?application/json", {{"accept", "text/html"}}));
  EXPECT_EQ(test::BodyOf(response), "application/json");
}

TEST(LanguageNegotiator, PrefixMatching) {
  App app = Language({{"fr", TermEcho("language")}, {"en-US", TermEcho("language")}});
  HttpResponse response = test::Run(app, test::Get("/", {{"accept-language", "en, fr;q=0.4"}}));
  EXPECT_EQ(response.headerValueOrEmpty(http::ContentLanguage), "en-US");
  EXPECT_EQ(test::BodyOf(response), "en-US");

  response = test::Run(app, test::Get("/", {{"accept-language", "de"}}));
  EXPECT_EQ(response.status(), http::StatusCodeNotAcceptable);
}

TEST(LanguageNegotiator, NoLanguageApp) {
  App app = Language({{"fr", TermEcho("language")}}, noLanguage());
  EXPECT_EQ(test::Run(app, test::Get("/", {{"accept-language", "ja"}})).status(), http::StatusCodeNotAcceptable);
}

TEST(CharsetNegotiator, AppendsToContentType) {
  App app = Charset({{"utf-8", TermEcho("charset")}, {"iso-8859-1", TermEcho("charset")}});
  HttpResponse response = test::Run(app, test::Get("/", {{"accept-charset", "iso-8859-1;q=0.2, utf-8"}}));
  EXPECT_EQ(response.headerValueOrEmpty(http::ContentType), "text/plain; charset=utf-8");
  EXPECT_EQ(test::BodyOf(response), "utf-8");
}

TEST(CharsetNegotiator, DefaultsContentTypeToTextPlain) {
  App app = Charset({{"utf-8", test::Respond(http::StatusCodeOK)}});
  HttpResponse response = test::Run(app, test::Get("/"));
  EXPECT_EQ(response.headerValueOrEmpty(http::ContentType), "text/plain; charset=utf-8");
}

TEST(CharsetNegotiator, ComposesWithContentType) {
  App app = ContentType({{"text/html", Charset({{"utf-8", test::Respond(http::StatusCodeOK, "<p>")}})}});
  HttpResponse response = test::Run(app, test::Get("/", {{"accept", "text/html"}}));
  // the outer negotiator annotates last
  EXPECT_EQ(response.headerValueOrEmpty(http::ContentType), "text/html");

  App inner = Charset({{"utf-8", ContentType({{"text/html", test::Respond(http::StatusCodeOK, "<p>")}})}});
  response = test::Run(inner, test::Get("/", {{"accept", "text/html"}}));
  EXPECT_EQ(response.headerValueOrEmpty(http::ContentType), "text/html; charset=utf-8");
}

TEST(EncodingNegotiator, SetsContentEncoding) {
  App app = Encoding({{"gzip", TermEcho("encoding")}, {"identity", TermEcho("encoding")}});
  HttpResponse response = test::Run(app, test::Get("/", {{"accept-encoding", "gzip;q=0.9, identity"}}));
  EXPECT_EQ(response.headerValueOrEmpty(http::ContentEncoding), "identity");

  response = test::Run(app, test::Get("/", {{"accept-encoding", "br"}}));
  EXPECT_EQ(response.status(), http::StatusCodeNotAcceptable);
}

TEST(HostNegotiator, AppendsServerPort) {
  EXPECT_EQ(HostWithPort(test::Get("/", {{"host", "example.com"}})), "example.com:8080");
  EXPECT_EQ(HostWithPort(test::Get("/", {{"host", "example.com:443"}})), "example.com:443");
  EXPECT_EQ(HostWithPort(test::Get("/", {{"host", "[::1]"}})), "[::1]:8080");
  EXPECT_EQ(HostWithPort(test::Get("/", {{"host", "[::1]:9000"}})), "[::1]:9000");
  EXPECT_EQ(HostWithPort(test::Get("/")), "*:8080");
}

TEST(HostNegotiator, DispatchesOnHost) {
  App app = Host({{"api.example.com:8080", TermEcho("host")},
                  {"www.example.com", TermEcho("host")},
                  {"*", test::Respond(http::StatusCodeOK, "fallback")}});

  HttpResponse response = test::Run(app, test::Get("/", {{"host", "api.example.com"}}));
  EXPECT_EQ(test::BodyOf(response), "api.example.com:8080");
  EXPECT_FALSE(response.headerValue(http::ContentLanguage));

  response = test::Run(app, test::Get("/", {{"host", "WWW.example.com:1234"}}));
  EXPECT_EQ(test::BodyOf(response), "www.example.com");

  response = test::Run(app, test::Get("/", {{"host", "api.example.com:9999"}}));
  EXPECT_EQ(test::BodyOf(response), "fallback");
}

TEST(HostNegotiator, UnknownHost) {
  App app = Host({{"www.example.com", TermEcho("host")}});
  EXPECT_EQ(test::Run(app, test::Get("/", {{"host", "other.org"}})).status(), http::StatusCodeNotAcceptable);
}

}  // namespace trellis

#include "trellis/routing.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "trellis/app-test-helpers.hpp"
#include "trellis/app.hpp"
#include "trellis/http-constants.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/response-builders.hpp"
#include "trellis/task.hpp"
#include "trellis/vector.hpp"

namespace trellis {

namespace {

// App counting its invocations, answering 'status'.
App Counting(std::shared_ptr<int> counter, http::StatusCode status, std::string body) {
  App respond = test::Respond(status, std::move(body));
  return [counter = std::move(counter), respond = std::move(respond)](HttpRequest request) {
    ++*counter;
    return respond(std::move(request));
  };
}

Task<App> SelectByQuery(const HttpRequest& request) {
  if (request.query() == "a") {
    co_return test::Respond(http::StatusCodeOK, "selected a");
  }
  co_return test::Respond(http::StatusCodeOK, "selected other");
}

// Appends "<tag>(" when invoked, suspends on 'queue', then appends "<tag>)" and answers 'status' with body <tag>.
Task<HttpResponse> TracedApp(TaskQueue* queue, std::shared_ptr<std::string> trace, char tag, http::StatusCode status,
                             HttpRequest /*request*/) {
  trace->push_back(tag);
  trace->push_back('(');
  co_await queue->yield();
  trace->push_back(tag);
  trace->push_back(')');
  co_return ok(std::string(1, tag), http::ContentTypeTextPlain, status);
}

App Traced(TaskQueue& queue, std::shared_ptr<std::string> trace, char tag, http::StatusCode status) {
  return [queue = &queue, trace = std::move(trace), tag, status](HttpRequest request) {
    return TracedApp(queue, trace, tag, status, std::move(request));
  };
}

Task<App> SelectAfterYield(TaskQueue* queue, std::string query) {
  co_await queue->yield();
  co_return test::Respond(http::StatusCodeOK, "deferred " + query);
}

}  // namespace

TEST(RouteTable, LookupAndReplace) {
  RouteTable table{{"a", test::Respond(http::StatusCodeOK, "a")}, {"b", test::Respond(http::StatusCodeOK, "b")}};
  EXPECT_EQ(table.size(), 2U);
  ASSERT_NE(table.lookup("a"), nullptr);
  EXPECT_EQ(table.lookup("c"), nullptr);

  table.add("a", test::Respond(http::StatusCodeCreated));
  EXPECT_EQ(table.size(), 2U);
  EXPECT_EQ(test::Run(*table.lookup("a"), test::Get("/")).status(), http::StatusCodeCreated);
  EXPECT_EQ(table.begin()->first, "a");
}

TEST(Branch, DispatchesOnFirstSegment) {
  App app = Branch({{"foo", test::EchoPath()}});
  HttpResponse response = test::Run(app, test::Get("/foo/bar"));
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(test::BodyOf(response), "/foo/|/bar");
}

TEST(Branch, NestedBranches) {
  App app = Branch({{"a", Branch({{"b", test::EchoPath()}})}});
  HttpResponse response = test::Run(app, test::Get("/a/b/c/d"));
  EXPECT_EQ(test::BodyOf(response), "/a/b/|/c/d");

  response = test::Run(app, test::Get("/a/b"));
  EXPECT_EQ(test::BodyOf(response), "/a/b/|");
}

TEST(Branch, UnknownSegmentIsNotFound) {
  App app = Branch({{"foo", test::EchoPath()}});
  EXPECT_EQ(test::Run(app, test::Get("/bar")).status(), http::StatusCodeNotFound);
  EXPECT_EQ(test::Run(app, test::Get("/foobar")).status(), http::StatusCodeNotFound);
  EXPECT_EQ(test::Run(app, test::Get("/")).status(), http::StatusCodeNotFound);
}

TEST(Branch, CustomNotFound) {
  App app = Branch({{"foo", test::EchoPath()}}, test::Respond(http::StatusCodeGone));
  EXPECT_EQ(test::Run(app, test::Get("/bar")).status(), http::StatusCodeGone);
}

TEST(Branch, RequiresLeadingSlash) {
  App app = Branch({{"foo", Branch({{"", test::EchoPath()}})}});
  // after consuming "foo" of "/foo", the remaining path is empty
  EXPECT_EQ(test::Run(app, test::Get("/foo")).status(), http::StatusCodeNotFound);
  EXPECT_EQ(test::Run(app, test::Get("/foo/")).status(), http::StatusCodeOK);
}

TEST(Branch, MatchesDecodedSegmentAndConsumesRawOne) {
  App app = Branch({{"a b", test::EchoPath()}});
  HttpResponse response = test::Run(app, test::Get("/a%20b/c"));
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(test::BodyOf(response), "/a%20b/|/c");

  EXPECT_EQ(test::Run(app, test::Get("/a%2/c")).status(), http::StatusCodeNotFound);
}

TEST(End, MatchesOnlyTrailingSlash) {
  App app = Branch({{"dir", End(test::EchoPath())}});
  HttpResponse response = test::Run(app, test::Get("/dir/"));
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(test::Run(app, test::Get("/dir")).status(), http::StatusCodeNotFound);
  EXPECT_EQ(test::Run(app, test::Get("/dir/file")).status(), http::StatusCodeNotFound);
}

TEST(Cap, OnlyWithoutRemainingPath) {
  App app = Branch({{"leaf", Cap(test::Respond(http::StatusCodeOK, "leaf"))}});
  EXPECT_EQ(test::Run(app, test::Get("/leaf")).status(), http::StatusCodeOK);
  EXPECT_EQ(test::Run(app, test::Get("/leaf/")).status(), http::StatusCodeOK);
  EXPECT_EQ(test::Run(app, test::Get("/leaf/more")).status(), http::StatusCodeNotFound);

  App custom = Cap(test::Respond(http::StatusCodeOK), test::Respond(http::StatusCodeGone));
  EXPECT_EQ(test::Run(custom, test::Get("/x")).status(), http::StatusCodeGone);
}

TEST(Method, DispatchesOnMethod) {
  App app = Method({{"GET", test::Respond(http::StatusCodeOK, "get")},
                    {"POST", test::Respond(http::StatusCodeCreated, "post")}});
  EXPECT_EQ(test::Run(app, test::Get("/")).status(), http::StatusCodeOK);
  EXPECT_EQ(test::Run(app, test::MakeRequest("POST", "/")).status(), http::StatusCodeCreated);

  HttpResponse response = test::Run(app, test::MakeRequest("PUT", "/x"));
  EXPECT_EQ(response.status(), http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(test::BodyOf(response), "Method Not Allowed: PUT /x\r\n");
}

TEST(FirstFound, SkipsNotFound) {
  auto firstCount = std::make_shared<int>(0);
  auto secondCount = std::make_shared<int>(0);
  App app = FirstFound(vector<App>{Counting(firstCount, http::StatusCodeNotFound, "a"),
                                   Counting(secondCount, http::StatusCodeOK, "b")});
  HttpResponse response = test::Run(app, test::Get("/"));
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(test::BodyOf(response), "b");
  EXPECT_EQ(*firstCount, 1);
  EXPECT_EQ(*secondCount, 1);
}

TEST(FirstFound, ReturnsLastNotFound) {
  App app = FirstFound(vector<App>{test::Respond(http::StatusCodeNotFound, "first"),
                                   test::Respond(http::StatusCodeNotFound, "last")});
  HttpResponse response = test::Run(app, test::Get("/"));
  EXPECT_EQ(response.status(), http::StatusCodeNotFound);
  EXPECT_EQ(test::BodyOf(response), "last");
}

TEST(FirstFound, StopsAtFirstNonNotFound) {
  auto thirdCount = std::make_shared<int>(0);
  App app = FirstFound(vector<App>{test::Respond(http::StatusCodeNotFound),
                                   test::Respond(http::StatusCodeInternalServerError, "error"),
                                   Counting(thirdCount, http::StatusCodeOK, "ok")});
  EXPECT_EQ(test::Run(app, test::Get("/")).status(), http::StatusCodeInternalServerError);
  EXPECT_EQ(*thirdCount, 0);
}

TEST(FirstFound, EachAppSeesTheOriginalRequest) {
  App app = FirstFound(vector<App>{Branch({{"a", test::Respond(http::StatusCodeNotFound)}}),
                                   Branch({{"a", test::EchoPath()}})});
  HttpResponse response = test::Run(app, test::Get("/a/b"));
  EXPECT_EQ(test::BodyOf(response), "/a/|/b");
}

TEST(FirstFound, RequiresApps) { EXPECT_THROW(FirstFound(vector<App>{}), std::invalid_argument); }

TEST(Select, UsesSelectedApp) {
  App app = Select(SelectByQuery);
  HttpResponse response = test::Run(app, test::Get("/?a"));
  EXPECT_EQ(test::BodyOf(response), "selected a");
  response = test::Run(app, test::Get("/?b"));
  EXPECT_EQ(test::BodyOf(response), "selected other");
}

TEST(FirstFound, PendingAppsAreTriedOneAfterTheOther) {
  TaskQueue queue;
  auto trace = std::make_shared<std::string>();
  App app = FirstFound(vector<App>{Traced(queue, trace, 'a', http::StatusCodeNotFound),
                                   Traced(queue, trace, 'b', http::StatusCodeNotFound),
                                   Traced(queue, trace, 'c', http::StatusCodeOK),
                                   Traced(queue, trace, 'd', http::StatusCodeOK)});

  Task<HttpResponse> task = app(test::Get("/"));
  task.resume();
  EXPECT_FALSE(task.done());
  EXPECT_EQ(*trace, "a(");
  EXPECT_EQ(queue.size(), 1U);

  queue.run();
  ASSERT_TRUE(task.done());
  HttpResponse response = task.result();
  EXPECT_EQ(*trace, "a(a)b(b)c(c)");
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(test::BodyOf(response), "c");
}

TEST(FirstFound, PendingNotFoundsReturnTheLastOne) {
  TaskQueue queue;
  auto trace = std::make_shared<std::string>();
  App app = FirstFound(vector<App>{Traced(queue, trace, 'a', http::StatusCodeNotFound),
                                   Traced(queue, trace, 'b', http::StatusCodeNotFound)});
  HttpResponse response = test::Run(app, test::Get("/"), queue);
  EXPECT_EQ(response.status(), http::StatusCodeNotFound);
  EXPECT_EQ(test::BodyOf(response), "b");
  EXPECT_EQ(*trace, "a(a)b(b)");
}

TEST(Branch, PendingAppsAreAwaited) {
  TaskQueue queue;
  App app = Branch({{"x", Method({{"GET", Cap(test::Deferred(queue, test::EchoPath()))}})}});

  HttpResponse response = test::Run(app, test::Get("/x"), queue);
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(test::BodyOf(response), "/x/|");
  EXPECT_TRUE(queue.empty());

  App deferredNotFound = Branch({{"x", test::EchoPath()}}, test::Deferred(queue, test::Respond(http::StatusCodeGone)));
  EXPECT_EQ(test::Run(deferredNotFound, test::Get("/y"), queue).status(), http::StatusCodeGone);
}

TEST(Select, PendingSelector) {
  TaskQueue queue;
  App app = Select([&queue](const HttpRequest& request) {
    return SelectAfterYield(&queue, std::string(request.query()));
  });
  HttpResponse response = test::Run(app, test::Get("/?q"), queue);
  EXPECT_EQ(test::BodyOf(response), "deferred q");
}

}  // namespace trellis

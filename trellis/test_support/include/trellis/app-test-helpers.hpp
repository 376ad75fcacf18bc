#pragma once

#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/app.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/task.hpp"

namespace trellis::test {

using HeaderList = std::initializer_list<std::pair<std::string_view, std::string_view>>;

// Request for given method and target, with given headers, from 127.0.0.1:40000 to port 8080.
HttpRequest MakeRequest(std::string_view method, std::string_view target, HeaderList headers = {});

inline HttpRequest Get(std::string_view target, HeaderList headers = {}) { return MakeRequest("GET", target, headers); }

// Synchronously runs 'app' on 'request'.
HttpResponse Run(const App& app, HttpRequest request);

// Runs 'app' on 'request', driving 'queue' until the response is produced.
HttpResponse Run(const App& app, HttpRequest request, TaskQueue& queue);

// Reads the whole body of 'response' (consuming it).
std::string BodyOf(HttpResponse& response);

// App answering 'status' with 'body' as text/plain.
App Respond(http::StatusCode status, std::string body = {});

// App failing with std::runtime_error(message).
App Failing(std::string message);

// App suspending on 'queue' before delegating to 'app': its response is pending until the queue is driven.
// 'queue' must outlive the App.
App Deferred(TaskQueue& queue, App app);

// App answering 200 with "<scriptName>|<pathInfo>" as body, to observe routing state.
App EchoPath();

}  // namespace trellis::test

// trellis Umbrella Header
//
// Include this single header to pull in the public application toolkit:
//   - App / Decorator and the Task coroutine type
//   - Request / Response primitives and response builders
//   - Routers (Branch, Method, negotiators, FirstFound...), file serving and sessions
//   - Decorators (Error, Log, Time, Headers...)
//
// Usage Example:
//    #include <trellis/trellis.hpp>
//    using namespace trellis;
//    int main() {
//      App app = Decorators({WithLog(), WithError()},
//                           Branch({{"static", FileTree("/srv/www")}, {"hello", Content("hi\n")}}));
//      HttpResponse response = SyncWait(app(HttpRequest("GET", "/hello")));
//    }

#pragma once

// Core types
#include "trellis/app.hpp"            // IWYU pragma: export
#include "trellis/http-body.hpp"      // IWYU pragma: export
#include "trellis/http-request.hpp"   // IWYU pragma: export
#include "trellis/http-response.hpp"  // IWYU pragma: export
#include "trellis/task.hpp"           // IWYU pragma: export

// Responses
#include "trellis/file-responder.hpp"     // IWYU pragma: export
#include "trellis/json-apps.hpp"          // IWYU pragma: export
#include "trellis/redirect.hpp"           // IWYU pragma: export
#include "trellis/response-builders.hpp"  // IWYU pragma: export

// Routing
#include "trellis/file-tree-config.hpp"  // IWYU pragma: export
#include "trellis/file-tree.hpp"         // IWYU pragma: export
#include "trellis/negotiators.hpp"       // IWYU pragma: export
#include "trellis/routing.hpp"           // IWYU pragma: export
#include "trellis/sessions.hpp"          // IWYU pragma: export

// Decorators
#include "trellis/decorators.hpp"  // IWYU pragma: export

// HTTP protocol constants
#include "trellis/http-constants.hpp"    // IWYU pragma: export
#include "trellis/http-status-code.hpp"  // IWYU pragma: export

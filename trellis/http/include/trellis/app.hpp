#pragma once

#include <functional>

#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/task.hpp"

namespace trellis {

// Unit of request handling. An App may complete immediately or suspend, callers always await its Task.
using App = std::function<Task<HttpResponse>(HttpRequest)>;

// Transforms an App into another one, wrapping behavior around it (see Decorators).
using Decorator = std::function<App(App)>;

}  // namespace trellis

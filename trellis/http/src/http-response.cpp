#include "trellis/http-response.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "trellis/http-body.hpp"
#include "trellis/http-constants.hpp"

namespace trellis {

HttpResponse& HttpResponse::body(std::string content, std::string_view contentType) & {
  const auto contentLength = content.size();
  _body = HttpBody(std::move(content));
  _headers.set(http::ContentType, contentType);
  _headers.set(http::ContentLength, std::string_view(std::to_string(contentLength)));
  return *this;
}

}  // namespace trellis

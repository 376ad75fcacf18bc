#pragma once

#include <string>
#include <utility>
#include <string_view>

#include "trellis/app.hpp"
#include "trellis/file-system.hpp"
#include "trellis/http-constants.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/json-serializer.hpp"

namespace trellis {

// Response with given in-memory content, Content-Type and Content-Length.
HttpResponse ok(std::string content, std::string_view contentType = http::ContentTypeTextPlain,
                http::StatusCode status = http::StatusCodeOK);

// Alias of ok.
inline HttpResponse content(std::string content, std::string_view contentType = http::ContentTypeTextPlain,
                            http::StatusCode status = http::StatusCodeOK) {
  return ok(std::move(content), contentType, status);
}

// Canonical page for given status: "<Reason Phrase>[: message]\r\n" as text/plain.
// Bodiless statuses (1xx, 204, 304) carry neither body nor Content-Type / Content-Length.
// Throws std::invalid_argument for a status without a known reason phrase.
HttpResponse responseForStatus(http::StatusCode status, std::string_view message = {});

// App answering responseForStatus(status, "<METHOD> <path>") to every request.
App appForStatus(http::StatusCode status);

// Ready made status apps.
App badRequest();
App notFound();
App methodNotAllowed();
App notAcceptable();

// Alias of notAcceptable, used when no language can be negotiated.
inline App noLanguage() { return notAcceptable(); }

// Serializes 'value' with glaze and responds it as application/json.
template <class T>
HttpResponse json(const T& value, http::StatusCode status = http::StatusCodeOK) {
  return ok(SerializeToJson(value), http::ContentTypeApplicationJson, status);
}

// Entity tag of a file: "<inode>-<size>-<modification time in ms since epoch>".
std::string etag(const FileStat& stat);

}  // namespace trellis

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "trellis/app.hpp"
#include "trellis/file-system.hpp"
#include "trellis/http-constants.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/task.hpp"
#include "trellis/vector.hpp"

namespace trellis {

// Responds the content of the file at 'path' with conditional (If-None-Match) and single range (Range, If-Range)
// semantics:
//  - 206 with Content-Range for a satisfiable range
//  - 416 for a range extending past the end of the file
//  - 304 when If-None-Match equals the file entity tag (only without Range)
//  - 200 with the whole content otherwise
// An unparsable Range header, or an If-Range precondition that fails, is ignored and the whole content is served.
// The Content-Type is 'contentType' if given, otherwise it is deduced from the file extension.
// FileSystem errors (missing file for instance) are propagated as std::system_error.
Task<HttpResponse> serveFile(HttpRequest request, std::string path, std::optional<std::string> contentType = {},
                             std::shared_ptr<const FileSystem> fileSystem = DefaultFileSystem());

// App serving always the same file. A file that cannot be read is answered by 'notFound'.
App FileApp(std::string path, std::optional<std::string> contentType = {}, App notFound = {},
            std::shared_ptr<const FileSystem> fileSystem = DefaultFileSystem());

// App streaming the concatenation of given files, in order. Files are opened one after the other while the body is
// consumed.
App FileConcat(vector<std::string> paths, std::string contentType = std::string(http::ContentTypeTextPlain),
               std::shared_ptr<const FileSystem> fileSystem = DefaultFileSystem());

}  // namespace trellis

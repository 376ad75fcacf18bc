#pragma once

#include <functional>
#include <string>

#include "trellis/app.hpp"
#include "trellis/http-request.hpp"
#include "trellis/routing.hpp"

namespace trellis {

// Extracts the preference list to negotiate against from a request.
using HeaderFunction = std::function<std::string(const HttpRequest&)>;

// Content negotiation routers.
// Each one picks, among the keys of its RouteTable, the best match for the request preference list (see BestMatch),
// records it in request.terms() and forwards the request to the associated App. Requests without any acceptable
// key are answered by 'notAcceptable' (406 by default). A missing header accepts anything.
// On a 200 response, the negotiated value is reflected in the response headers as documented per negotiator.
// 'header' overrides the way the preference list is read from the request.

// Negotiates on 'accept' (term "content-type"), sets 'content-type'.
App ContentType(RouteTable types, App notAcceptable = {}, HeaderFunction header = {});

// Negotiates on 'accept-language' (term "language"), sets 'content-language'.
App Language(RouteTable languages, App notAcceptable = {}, HeaderFunction header = {});

// Negotiates on 'accept-charset' (term "charset"), appends "; charset=<value>" to 'content-type' (which defaults to
// text/plain).
App Charset(RouteTable charsets, App notAcceptable = {}, HeaderFunction header = {});

// Negotiates on 'accept-encoding' (term "encoding"), sets 'content-encoding'.
App Encoding(RouteTable encodings, App notAcceptable = {}, HeaderFunction header = {});

// Negotiates on the 'host' header (term "host"), with the server port appended when the header has none.
// Keys are "*", "name" (any port) or "name:port". The response is never annotated.
App Host(RouteTable hosts, App notAcceptable = {}, HeaderFunction header = {});

// Value of the 'host' header ("*" if absent), with ":<serverPort>" appended when it does not carry a port.
std::string HostWithPort(const HttpRequest& request);

}  // namespace trellis

#pragma once

#include <string_view>

#include "trellis/http-status-code.hpp"

namespace trellis::http {

// Methods
inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view HEAD = "HEAD";
inline constexpr std::string_view POST = "POST";
inline constexpr std::string_view PUT = "PUT";
inline constexpr std::string_view DELETE = "DELETE";
inline constexpr std::string_view OPTIONS = "OPTIONS";
inline constexpr std::string_view PATCH = "PATCH";

// Header names, in the lower case form under which they are stored.
inline constexpr std::string_view Accept = "accept";
inline constexpr std::string_view AcceptCharset = "accept-charset";
inline constexpr std::string_view AcceptEncoding = "accept-encoding";
inline constexpr std::string_view AcceptLanguage = "accept-language";
inline constexpr std::string_view ContentEncoding = "content-encoding";
inline constexpr std::string_view ContentLanguage = "content-language";
inline constexpr std::string_view ContentLength = "content-length";
inline constexpr std::string_view ContentRange = "content-range";
inline constexpr std::string_view ContentType = "content-type";
inline constexpr std::string_view Cookie = "cookie";
inline constexpr std::string_view Date = "date";
inline constexpr std::string_view ETag = "etag";
inline constexpr std::string_view Expires = "expires";
inline constexpr std::string_view Host = "host";
inline constexpr std::string_view IfNoneMatch = "if-none-match";
inline constexpr std::string_view IfRange = "if-range";
inline constexpr std::string_view Location = "location";
inline constexpr std::string_view Range = "range";
inline constexpr std::string_view SetCookie = "set-cookie";
inline constexpr std::string_view TransferEncoding = "transfer-encoding";
inline constexpr std::string_view XResponseTime = "x-response-time";

// Content types
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";

/// Standard reason phrase of given status code, empty for codes that are not registered.
constexpr std::string_view ReasonPhraseFor(StatusCode status) noexcept {
  switch (status) {
    case 100:
      return "Continue";
    case 101:
      return "Switching Protocols";
    case 102:
      return "Processing";
    case 200:
      return "OK";
    case 201:
      return "Created";
    case 202:
      return "Accepted";
    case 203:
      return "Non-Authoritative Information";
    case 204:
      return "No Content";
    case 205:
      return "Reset Content";
    case 206:
      return "Partial Content";
    case 207:
      return "Multi-Status";
    case 300:
      return "Multiple Choices";
    case 301:
      return "Moved Permanently";
    case 302:
      return "Found";
    case 303:
      return "See Other";
    case 304:
      return "Not Modified";
    case 305:
      return "Use Proxy";
    case 307:
      return "Temporary Redirect";
    case 308:
      return "Permanent Redirect";
    case 400:
      return "Bad Request";
    case 401:
      return "Unauthorized";
    case 402:
      return "Payment Required";
    case 403:
      return "Forbidden";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 406:
      return "Not Acceptable";
    case 407:
      return "Proxy Authentication Required";
    case 408:
      return "Request Timeout";
    case 409:
      return "Conflict";
    case 410:
      return "Gone";
    case 411:
      return "Length Required";
    case 412:
      return "Precondition Failed";
    case 413:
      return "Content Too Large";
    case 414:
      return "URI Too Long";
    case 415:
      return "Unsupported Media Type";
    case 416:
      return "Range Not Satisfiable";
    case 417:
      return "Expectation Failed";
    case 422:
      return "Unprocessable Content";
    case 423:
      return "Locked";
    case 424:
      return "Failed Dependency";
    case 426:
      return "Upgrade Required";
    case 428:
      return "Precondition Required";
    case 429:
      return "Too Many Requests";
    case 431:
      return "Request Header Fields Too Large";
    case 500:
      return "Internal Server Error";
    case 501:
      return "Not Implemented";
    case 502:
      return "Bad Gateway";
    case 503:
      return "Service Unavailable";
    case 504:
      return "Gateway Timeout";
    case 505:
      return "HTTP Version Not Supported";
    case 507:
      return "Insufficient Storage";
    default:
      return {};
  }
}

}  // namespace trellis::http

#pragma once

#include <string_view>

namespace trellis {

struct MIMEMapping {
  std::string_view extension;
  std::string_view mimeType;
};

inline constexpr std::string_view kDefaultMIMEType = "application/octet-stream";

// Sorted by extension (checked at compile time), extensions are lower case and without the leading dot.
inline constexpr MIMEMapping kMIMEMappings[] = {
    {"7z", "application/x-7z-compressed"},
    {"aac", "audio/aac"},
    {"appcache", "text/cache-manifest"},
    {"avif", "image/avif"},
    {"bin", "application/octet-stream"},
    {"bmp", "image/bmp"},
    {"bz2", "application/x-bzip2"},
    {"css", "text/css"},
    {"csv", "text/csv"},
    {"eot", "application/vnd.ms-fontobject"},
    {"epub", "application/epub+zip"},
    {"gif", "image/gif"},
    {"gz", "application/gzip"},
    {"htm", "text/html"},
    {"html", "text/html"},
    {"ico", "image/x-icon"},
    {"ics", "text/calendar"},
    {"jpeg", "image/jpeg"},
    {"jpg", "image/jpeg"},
    {"js", "text/javascript"},
    {"json", "application/json"},
    {"jsonld", "application/ld+json"},
    {"manifest", "text/cache-manifest"},
    {"md", "text/markdown"},
    {"mjs", "text/javascript"},
    {"mp3", "audio/mpeg"},
    {"mp4", "video/mp4"},
    {"mpeg", "video/mpeg"},
    {"oga", "audio/ogg"},
    {"ogg", "audio/ogg"},
    {"ogv", "video/ogg"},
    {"otf", "font/otf"},
    {"pdf", "application/pdf"},
    {"png", "image/png"},
    {"rss", "application/rss+xml"},
    {"rtf", "application/rtf"},
    {"svg", "image/svg+xml"},
    {"tar", "application/x-tar"},
    {"tif", "image/tiff"},
    {"tiff", "image/tiff"},
    {"ttf", "font/ttf"},
    {"txt", "text/plain"},
    {"wasm", "application/wasm"},
    {"wav", "audio/wav"},
    {"webm", "video/webm"},
    {"webp", "image/webp"},
    {"woff", "font/woff"},
    {"woff2", "font/woff2"},
    {"xhtml", "application/xhtml+xml"},
    {"xml", "application/xml"},
    {"zip", "application/zip"},
};

// Extension of the last path component, without the dot ("archive.tar.gz" -> "gz", ".profile" -> "").
std::string_view PathExtension(std::string_view path);

// MIME type registered for given extension (case insensitive, with or without leading dot), empty if unknown.
std::string_view LookupMIMEType(std::string_view extension);

// MIME type of given path, kDefaultMIMEType when its extension is unknown.
std::string_view DetermineMIMETypeStr(std::string_view path);

}  // namespace trellis

#pragma once

#include <string>
#include <string_view>

namespace trellis::url {

/// Removes "." and ".." segments from a path (RFC 3986, section 5.2.4).
std::string RemoveDotSegments(std::string_view path);

/// Resolves 'reference' against 'base' following RFC 3986, section 5.2.2.
/// 'base' may be an absolute URL or an absolute path ("/a/b?x"), in which case the result is an absolute path.
///   Resolve("/a/b/c", "../d")    -> "/a/d"
///   Resolve("/a/b/", "~session/") -> "/a/b/~session/"
///   Resolve("/a/b", "http://x/y")  -> "http://x/y"
std::string Resolve(std::string_view base, std::string_view reference);

}  // namespace trellis::url

#pragma once

#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace trellis {

// Raised when a value cannot be serialized to JSON.
class JsonError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Serialize a C++ object to a JSON string using glaze.
/// T must be a type that glaze can serialize (reflectable aggregate or with a glz::meta specialization).
/// Throws JsonError on failure.
template <typename T>
[[nodiscard]] std::string SerializeToJson(const T& obj) {
  auto result = glz::write_json(obj);
  if (!result) {
    throw JsonError("JSON serialization failed: " + std::string(glz::format_error(result.error())));
  }
  return std::move(*result);
}

/// Parse a JSON document into a T, std::nullopt if the document is malformed or does not match T.
template <typename T>
[[nodiscard]] std::optional<T> ParseJson(std::string_view json) {
  auto result = glz::read_json<T>(json);
  if (!result) {
    return std::nullopt;
  }
  return std::move(*result);
}

}  // namespace trellis

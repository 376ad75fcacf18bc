#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/vector.hpp"

namespace trellis {

/// Insertion ordered header map with case-insensitive lookup.
/// Names are stored lower cased, values as given. Setting an existing name replaces its value in place.
class HeadersMap {
 public:
  using value_type = std::pair<std::string, std::string>;
  using const_iterator = vector<value_type>::const_iterator;

  HeadersMap() noexcept = default;

  HeadersMap(std::initializer_list<std::pair<std::string_view, std::string_view>> headers);

  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view getOrEmpty(std::string_view name) const noexcept {
    return get(name).value_or(std::string_view{});
  }

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return get(name).has_value(); }

  // Sets (or replaces) the value of given header.
  HeadersMap& set(std::string_view name, std::string_view value);

  // Sets the value of given header only if it is not present yet. Returns true if it was inserted.
  bool setIfAbsent(std::string_view name, std::string_view value);

  // Removes given header, returns true if it was present.
  bool erase(std::string_view name) noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _entries.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _entries.end(); }

 private:
  [[nodiscard]] std::size_t find(std::string_view name) const noexcept;

  vector<value_type> _entries;
};

}  // namespace trellis

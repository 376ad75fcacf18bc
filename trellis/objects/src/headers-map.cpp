#include "trellis/headers-map.hpp"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <utility>

#include "trellis/ascii.hpp"

namespace trellis {

HeadersMap::HeadersMap(std::initializer_list<std::pair<std::string_view, std::string_view>> headers) {
  for (const auto& [name, value] : headers) {
    set(name, value);
  }
}

std::size_t HeadersMap::find(std::string_view name) const noexcept {
  for (std::size_t pos = 0; pos < _entries.size(); ++pos) {
    if (EqualsIgnoreCase(_entries[pos].first, name)) {
      return pos;
    }
  }
  return _entries.size();
}

std::optional<std::string_view> HeadersMap::get(std::string_view name) const noexcept {
  const auto pos = find(name);
  if (pos == _entries.size()) {
    return std::nullopt;
  }
  return std::string_view(_entries[pos].second);
}

HeadersMap& HeadersMap::set(std::string_view name, std::string_view value) {
  const auto pos = find(name);
  if (pos == _entries.size()) {
    _entries.emplace_back(AsciiLowerCopy(name), std::string(value));
  } else {
    _entries[pos].second.assign(value);
  }
  return *this;
}

bool HeadersMap::setIfAbsent(std::string_view name, std::string_view value) {
  if (find(name) != _entries.size()) {
    return false;
  }
  _entries.emplace_back(AsciiLowerCopy(name), std::string(value));
  return true;
}

bool HeadersMap::erase(std::string_view name) noexcept {
  const auto pos = find(name);
  if (pos == _entries.size()) {
    return false;
  }
  _entries.erase(_entries.begin() + static_cast<std::ptrdiff_t>(pos));
  return true;
}

}  // namespace trellis

#include "framelink/header-map.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string_view>

#include "framelink/string-equal-ignore-case.hpp"

namespace framelink::http {

namespace {

auto NameIs(std::string_view name) {
  return [name](const Header& header) { return CaseInsensitiveEqual(header.name, name); };
}

}  // namespace

bool HeaderMap::contains(std::string_view name) const noexcept {
  return std::ranges::any_of(_headers, NameIs(name));
}

std::size_t HeaderMap::count(std::string_view name) const noexcept {
  return static_cast<std::size_t>(std::ranges::count_if(_headers, NameIs(name)));
}

std::optional<std::string_view> HeaderMap::first(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(_headers, NameIs(name));
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

std::optional<std::string_view> HeaderMap::last(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(_headers.rbegin(), _headers.rend(), NameIs(name));
  if (it == _headers.rend()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

void HeaderMap::add(std::string_view name, std::string_view value) {
  _headers.emplace_back(std::string(name), std::string(value));
}

void HeaderMap::set(std::string_view name, std::string_view value) {
  auto it = std::ranges::find_if(_headers, NameIs(name));
  if (it == _headers.end()) {
    add(name, value);
    return;
  }
  it->value.assign(value);
  // drop any later duplicate
  const auto [eraseFirst, eraseLast] = std::ranges::remove_if(it + 1, _headers.end(), NameIs(name));
  _headers.erase(eraseFirst, eraseLast);
}

std::size_t HeaderMap::erase(std::string_view name) { return std::erase_if(_headers, NameIs(name)); }

}  // namespace framelink::http

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace framelink::http {

struct Header {
  std::string name;
  std::string value;
};

// Ordered multi-map of HTTP header fields with case-insensitive name lookup.
// A field may appear several times; insertion order is preserved so that callers can
// choose which occurrence governs (the first for Content-Length, the last for Transfer-Encoding).
// The original casing of names is preserved for emission.
class HeaderMap {
 public:
  using const_iterator = std::vector<Header>::const_iterator;

  HeaderMap() = default;

  [[nodiscard]] bool contains(std::string_view name) const noexcept;

  // Number of occurrences of given header name.
  [[nodiscard]] std::size_t count(std::string_view name) const noexcept;

  // Value of the first occurrence, if any.
  [[nodiscard]] std::optional<std::string_view> first(std::string_view name) const noexcept;

  // Value of the last occurrence, if any.
  [[nodiscard]] std::optional<std::string_view> last(std::string_view name) const noexcept;

  // Append a header line (duplicates allowed).
  void add(std::string_view name, std::string_view value);

  // Set or replace a header value ensuring at most one instance.
  // The position and casing of the first occurrence are kept if it already exists.
  void set(std::string_view name, std::string_view value);

  // Remove all occurrences of given header name. Returns the number of removed lines.
  std::size_t erase(std::string_view name);

  void clear() noexcept { _headers.clear(); }

  [[nodiscard]] std::size_t size() const noexcept { return _headers.size(); }
  [[nodiscard]] bool empty() const noexcept { return _headers.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _headers.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _headers.end(); }

 private:
  std::vector<Header> _headers;
};

}  // namespace framelink::http

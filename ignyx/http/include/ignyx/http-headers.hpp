#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "ignyx/vector.hpp"

namespace ignyx {

// Returns the conventional casing of a header name ("content-type" -> "Content-Type",
// "sec-websocket-accept" -> "Sec-WebSocket-Accept").
[[nodiscard]] std::string CanonicalHeaderName(std::string_view name);

// Ordered header multimap. Lookups are case-insensitive, insertion order is preserved and names are
// stored in canonical casing so that serialization emits them as-is.
class HeaderMap {
 public:
  struct Entry {
    std::string name;
    std::string value;

    bool operator==(const Entry&) const = default;
  };

  HeaderMap() noexcept = default;

  // Adds a new entry, keeping existing ones with the same name.
  HeaderMap& append(std::string_view name, std::string_view value);

  // Replaces all entries named 'name' by a single one, at the position of the first of them.
  HeaderMap& set(std::string_view name, std::string_view value);

  // Removes all entries named 'name'. Returns the number of removed entries.
  std::size_t erase(std::string_view name);

  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view getOrEmpty(std::string_view name) const noexcept {
    return get(name).value_or(std::string_view{});
  }

  [[nodiscard]] vector<std::string_view> getAll(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return get(name).has_value(); }

  [[nodiscard]] std::span<const Entry> entries() const noexcept { return {_entries.data(), _entries.size()}; }

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

  void clear() noexcept { _entries.clear(); }

  bool operator==(const HeaderMap&) const = default;

 private:
  vector<Entry> _entries;
};

}  // namespace ignyx

#include "ignyx/http-headers.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/string-equal-ignore-case.hpp"
#include "ignyx/toupperlower.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

namespace {

// Tokens whose conventional spelling does not follow the simple capitalization rule.
constexpr std::array<std::string_view, 6> kSpecialTokens{"WebSocket", "ETag", "WWW", "TE", "DNT", "MD5"};

}  // namespace

std::string CanonicalHeaderName(std::string_view name) {
  std::string out;
  out.reserve(name.size());
  while (!name.empty()) {
    const auto dashPos = name.find('-');
    const std::string_view token = name.substr(0, dashPos);
    const auto special = std::ranges::find_if(
        kSpecialTokens, [token](std::string_view candidate) { return CaseInsensitiveEqual(candidate, token); });
    if (special != kSpecialTokens.end()) {
      out.append(*special);
    } else {
      for (std::size_t pos = 0; pos < token.size(); ++pos) {
        out.push_back(pos == 0 ? toupper(token[pos]) : tolower(token[pos]));
      }
    }
    if (dashPos == std::string_view::npos) {
      break;
    }
    out.push_back('-');
    name.remove_prefix(dashPos + 1);
  }
  return out;
}

HeaderMap& HeaderMap::append(std::string_view name, std::string_view value) {
  _entries.push_back(Entry{CanonicalHeaderName(name), std::string(value)});
  return *this;
}

HeaderMap& HeaderMap::set(std::string_view name, std::string_view value) {
  auto it = std::ranges::find_if(_entries, [name](const Entry& entry) { return CaseInsensitiveEqual(entry.name, name); });
  if (it == _entries.end()) {
    return append(name, value);
  }
  it->value.assign(value);
  const auto firstPos = static_cast<std::size_t>(it - _entries.begin());
  std::size_t writePos = firstPos + 1;
  for (std::size_t readPos = firstPos + 1; readPos < _entries.size(); ++readPos) {
    if (!CaseInsensitiveEqual(_entries[readPos].name, name)) {
      if (writePos != readPos) {
        _entries[writePos] = std::move(_entries[readPos]);
      }
      ++writePos;
    }
  }
  _entries.resize(writePos);
  return *this;
}

std::size_t HeaderMap::erase(std::string_view name) {
  const auto before = _entries.size();
  const auto removed =
      std::ranges::remove_if(_entries, [name](const Entry& entry) { return CaseInsensitiveEqual(entry.name, name); });
  _entries.erase(removed.begin(), removed.end());
  return before - _entries.size();
}

std::optional<std::string_view> HeaderMap::get(std::string_view name) const noexcept {
  for (const Entry& entry : _entries) {
    if (CaseInsensitiveEqual(entry.name, name)) {
      return std::string_view(entry.value);
    }
  }
  return std::nullopt;
}

vector<std::string_view> HeaderMap::getAll(std::string_view name) const {
  vector<std::string_view> values;
  for (const Entry& entry : _entries) {
    if (CaseInsensitiveEqual(entry.name, name)) {
      values.emplace_back(entry.value);
    }
  }
  return values;
}

}  // namespace ignyx

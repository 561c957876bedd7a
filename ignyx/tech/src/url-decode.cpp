#include "ignyx/url-decode.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/vector.hpp"

namespace ignyx::url {

namespace {

constexpr int FromHexDigit(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  return -1;
}

// Returns false on the first malformed escape when 'strict' is set.
bool DecodeInto(std::string_view encoded, PlusPolicy plusPolicy, bool strict, std::string& out) {
  out.reserve(out.size() + encoded.size());
  for (std::size_t pos = 0; pos < encoded.size(); ++pos) {
    const char ch = encoded[pos];
    if (ch == '+' && plusPolicy == PlusPolicy::AsSpace) {
      out.push_back(' ');
      continue;
    }
    if (ch != '%') {
      out.push_back(ch);
      continue;
    }
    if (encoded.size() - pos < 3) {
      if (strict) {
        return false;
      }
      out.push_back('%');
      continue;
    }
    const int v1 = FromHexDigit(encoded[pos + 1]);
    const int v2 = FromHexDigit(encoded[pos + 2]);
    if (v1 < 0 || v2 < 0) {
      if (strict) {
        return false;
      }
      out.push_back('%');
      continue;
    }
    out.push_back(static_cast<char>((v1 << 4) | v2));
    pos += 2;
  }
  return true;
}

}  // namespace

std::optional<std::string> Decode(std::string_view encoded, PlusPolicy plusPolicy) {
  std::string out;
  if (!DecodeInto(encoded, plusPolicy, true, out)) {
    return std::nullopt;
  }
  return out;
}

std::string DecodeLenient(std::string_view encoded, PlusPolicy plusPolicy) {
  std::string out;
  DecodeInto(encoded, plusPolicy, false, out);
  return out;
}

vector<std::pair<std::string, std::string>> ParseQueryString(std::string_view query) {
  vector<std::pair<std::string, std::string>> pairs;
  while (!query.empty()) {
    const auto ampPos = query.find('&');
    const std::string_view pair = query.substr(0, ampPos);
    query = ampPos == std::string_view::npos ? std::string_view{} : query.substr(ampPos + 1);
    if (pair.empty()) {
      continue;
    }
    const auto eqPos = pair.find('=');
    std::string_view key = pair.substr(0, eqPos);
    std::string_view value = eqPos == std::string_view::npos ? std::string_view{} : pair.substr(eqPos + 1);
    pairs.emplace_back(DecodeLenient(key, PlusPolicy::AsSpace), DecodeLenient(value, PlusPolicy::AsSpace));
  }
  return pairs;
}

}  // namespace ignyx::url

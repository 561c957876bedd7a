#include "ignyx/cookie.hpp"

#include <format>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/string-trim.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

Cookie Cookie::Deletion(std::string name, std::string path) {
  Cookie cookie;
  cookie.name = std::move(name);
  cookie.maxAge = 0;
  cookie.expires = "Thu, 01 Jan 1970 00:00:00 GMT";
  cookie.path = std::move(path);
  return cookie;
}

std::string Cookie::toHeaderValue() const {
  std::string out = std::format("{}={}", name, value);
  if (maxAge) {
    out.append(std::format("; Max-Age={}", *maxAge));
  }
  if (expires) {
    out.append("; Expires=").append(*expires);
  }
  if (!path.empty()) {
    out.append("; Path=").append(path);
  }
  if (domain) {
    out.append("; Domain=").append(*domain);
  }
  if (secure) {
    out.append("; Secure");
  }
  if (httpOnly) {
    out.append("; HttpOnly");
  }
  switch (sameSite) {
    case SameSite::Lax:
      out.append("; SameSite=Lax");
      break;
    case SameSite::Strict:
      out.append("; SameSite=Strict");
      break;
    case SameSite::None:
      out.append("; SameSite=None");
      break;
    default:
      break;
  }
  return out;
}

vector<std::pair<std::string, std::string>> ParseCookieHeader(std::string_view header) {
  vector<std::pair<std::string, std::string>> cookies;
  while (!header.empty()) {
    const auto sepPos = header.find(';');
    const std::string_view pair = Trim(header.substr(0, sepPos), kOws);
    header = sepPos == std::string_view::npos ? std::string_view{} : header.substr(sepPos + 1);

    const auto eqPos = pair.find('=');
    if (eqPos == std::string_view::npos || eqPos == 0) {
      continue;
    }
    std::string_view value = Trim(pair.substr(eqPos + 1), kOws);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
      value = value.substr(1, value.size() - 2);
    }
    cookies.emplace_back(std::string(Trim(pair.substr(0, eqPos), kOws)), std::string(value));
  }
  return cookies;
}

}  // namespace ignyx

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/vector.hpp"

namespace ignyx {

// A Set-Cookie directive attached to a response.
struct Cookie {
  enum class SameSite : uint8_t { Unset, Lax, Strict, None };

  std::string name;
  std::string value;
  std::optional<int64_t> maxAge;
  std::optional<std::string> expires;
  std::string path{"/"};
  std::optional<std::string> domain;
  bool secure{false};
  bool httpOnly{false};
  SameSite sameSite{SameSite::Lax};

  // Directive expiring 'name' immediately on the client.
  static Cookie Deletion(std::string name, std::string path = "/");

  // Value of a Set-Cookie header: "name=value; Max-Age=60; Path=/; HttpOnly; SameSite=Lax".
  [[nodiscard]] std::string toHeaderValue() const;
};

// Parses a request Cookie header ("a=1; b=2") into name / value pairs, keeping order.
// Values surrounded by double quotes are unquoted. Malformed pairs without '=' are skipped.
[[nodiscard]] vector<std::pair<std::string, std::string>> ParseCookieHeader(std::string_view header);

}  // namespace ignyx

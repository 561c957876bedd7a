#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "ignyx/vector.hpp"

namespace ignyx {

// Compiled form of a route template such as "/users/{id}/files/{rest:path}".
//  - literal segments match exactly
//  - "{name}" (or "{name:str}") matches one non-empty segment
//  - "{name:path}" as last segment matches the whole remainder of the path, slashes included
// A trailing '/' is significant: "/items" and "/items/" are distinct templates.
struct PathTemplate {
  enum class SegmentKind : uint8_t { Literal, Param, CatchAll };

  struct Segment {
    SegmentKind kind;
    std::string text;  // literal text, or parameter name
  };

  // Throws std::invalid_argument for malformed templates.
  static PathTemplate Compile(std::string_view pattern);

  // Names of the parameters, in template order.
  [[nodiscard]] vector<std::string> paramNames() const;

  [[nodiscard]] bool endsWithCatchAll() const noexcept {
    return !segments.empty() && segments.back().kind == SegmentKind::CatchAll;
  }

  std::string pattern;
  vector<Segment> segments;
  bool trailingSlash{false};
};

}  // namespace ignyx

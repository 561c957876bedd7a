#include "ignyx/path-template.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>

#include "ignyx/vector.hpp"

namespace ignyx {

namespace {

constexpr bool IsIdentifier(std::string_view name) {
  if (name.empty() || (name.front() >= '0' && name.front() <= '9')) {
    return false;
  }
  return std::ranges::all_of(name, [](char ch) {
    return ch == '_' || (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
  });
}

[[noreturn]] void ThrowInvalid(std::string_view pattern, std::string_view reason) {
  throw std::invalid_argument(std::string("Invalid route template '").append(pattern).append("': ").append(reason));
}

}  // namespace

PathTemplate PathTemplate::Compile(std::string_view pattern) {
  if (pattern.empty() || pattern.front() != '/') {
    ThrowInvalid(pattern, "must start with '/'");
  }
  PathTemplate compiled;
  compiled.pattern.assign(pattern);

  std::string_view remaining = pattern.substr(1);
  while (!remaining.empty()) {
    const auto slashPos = remaining.find('/');
    const std::string_view segment = remaining.substr(0, slashPos);
    if (segment.empty()) {
      ThrowInvalid(pattern, "empty segment");
    }
    if (!compiled.segments.empty() && compiled.segments.back().kind == SegmentKind::CatchAll) {
      ThrowInvalid(pattern, "catch-all parameter must be the last segment");
    }

    if (segment.front() == '{') {
      if (segment.back() != '}') {
        ThrowInvalid(pattern, "parameters must span a whole segment");
      }
      std::string_view inner = segment.substr(1, segment.size() - 2);
      SegmentKind kind = SegmentKind::Param;
      const auto colonPos = inner.find(':');
      if (colonPos != std::string_view::npos) {
        const std::string_view convertor = inner.substr(colonPos + 1);
        if (convertor == "path") {
          kind = SegmentKind::CatchAll;
        } else if (convertor != "str") {
          ThrowInvalid(pattern, "unknown parameter convertor");
        }
        inner = inner.substr(0, colonPos);
      }
      if (!IsIdentifier(inner)) {
        ThrowInvalid(pattern, "invalid parameter name");
      }
      if (std::ranges::any_of(compiled.segments, [inner](const Segment& seg) {
            return seg.kind != SegmentKind::Literal && seg.text == inner;
          })) {
        ThrowInvalid(pattern, "duplicated parameter name");
      }
      compiled.segments.push_back(Segment{kind, std::string(inner)});
    } else {
      if (segment.find_first_of("{}") != std::string_view::npos) {
        ThrowInvalid(pattern, "parameters must span a whole segment");
      }
      compiled.segments.push_back(Segment{SegmentKind::Literal, std::string(segment)});
    }

    if (slashPos == std::string_view::npos) {
      break;
    }
    remaining.remove_prefix(slashPos + 1);
    if (remaining.empty()) {
      if (compiled.endsWithCatchAll()) {
        ThrowInvalid(pattern, "catch-all parameter must be the last segment");
      }
      compiled.trailingSlash = true;
    }
  }
  // Root template "/" is a trailing slash on an empty path.
  if (compiled.segments.empty()) {
    compiled.trailingSlash = true;
  }
  return compiled;
}

vector<std::string> PathTemplate::paramNames() const {
  vector<std::string> names;
  for (const Segment& segment : segments) {
    if (segment.kind != SegmentKind::Literal) {
      names.push_back(segment.text);
    }
  }
  return names;
}

}  // namespace ignyx

#pragma once

#include <string_view>

namespace ignyx {

inline constexpr std::string_view kWhitespace = " \t\r\n\f\v";

// Optional white space as defined by RFC 9110 (space and horizontal tab).
inline constexpr std::string_view kOws = " \t";

constexpr std::string_view TrimLeft(std::string_view sv, std::string_view chars = kWhitespace) noexcept {
  const auto first = sv.find_first_not_of(chars);
  return first == std::string_view::npos ? std::string_view{} : sv.substr(first);
}

constexpr std::string_view TrimRight(std::string_view sv, std::string_view chars = kWhitespace) noexcept {
  const auto last = sv.find_last_not_of(chars);
  return last == std::string_view::npos ? std::string_view{} : sv.substr(0, last + 1);
}

constexpr std::string_view Trim(std::string_view sv, std::string_view chars = kWhitespace) noexcept {
  return TrimRight(TrimLeft(sv, chars), chars);
}

}  // namespace ignyx

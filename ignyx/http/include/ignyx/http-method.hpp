#pragma once

#include <bit>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace ignyx::http {

enum class Method : uint16_t {
  GET = 1 << 0,
  HEAD = 1 << 1,
  POST = 1 << 2,
  PUT = 1 << 3,
  DELETE = 1 << 4,
  CONNECT = 1 << 5,
  OPTIONS = 1 << 6,
  TRACE = 1 << 7,
  PATCH = 1 << 8
};

using MethodIdx = std::underlying_type_t<Method>;
inline constexpr MethodIdx kNbMethods = 9;

// Set of methods, one bit per method.
using MethodBmp = uint16_t;

constexpr MethodBmp operator|(Method lhs, Method rhs) noexcept {
  return static_cast<MethodBmp>(static_cast<MethodBmp>(lhs) | static_cast<MethodBmp>(rhs));
}

constexpr MethodBmp operator|(MethodBmp lhs, Method rhs) noexcept {
  return static_cast<MethodBmp>(lhs | static_cast<MethodBmp>(rhs));
}

constexpr bool IsMethodSet(MethodBmp mask, Method method) { return (mask & static_cast<MethodBmp>(method)) != 0U; }

constexpr MethodIdx MethodToIdx(Method method) {
  return static_cast<MethodIdx>(std::countr_zero(static_cast<MethodIdx>(method)));
}

constexpr Method MethodFromIdx(MethodIdx methodIdx) { return static_cast<Method>(1U << methodIdx); }

inline constexpr std::string_view kMethodStrings[] = {"GET",     "HEAD",    "POST",  "PUT",  "DELETE",
                                                      "CONNECT", "OPTIONS", "TRACE", "PATCH"};

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[MethodToIdx(method)]; }

// Methods are case-sensitive tokens (RFC 9110 9.1).
constexpr std::optional<Method> MethodStrToOpt(std::string_view str) {
  for (MethodIdx idx = 0; idx < kNbMethods; ++idx) {
    if (kMethodStrings[idx] == str) {
      return MethodFromIdx(idx);
    }
  }
  return std::nullopt;
}

// Comma separated list in canonical order, as used in the Allow header ("GET, HEAD, POST").
std::string MethodBmpToStr(MethodBmp methods);

}  // namespace ignyx::http

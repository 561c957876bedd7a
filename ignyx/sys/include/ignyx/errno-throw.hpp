#pragma once

#include <cerrno>
#include <format>
#include <string_view>
#include <system_error>

namespace ignyx {

// Captures errno immediately and throws std::system_error with a formatted message.
// Usage: throw_errno("bind failed for port {}", port);
template <typename... Args>
[[noreturn]] void throw_errno(std::string_view fmt, const Args&... args) {
  const int savedErr = errno;
  throw std::system_error(std::error_code(savedErr, std::generic_category()),
                          std::vformat(fmt, std::make_format_args(args...)));
}

}  // namespace ignyx

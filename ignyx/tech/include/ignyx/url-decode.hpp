#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/vector.hpp"

namespace ignyx::url {

enum class PlusPolicy : bool { Keep, AsSpace };

// Decodes percent-encoded sequences of 'encoded'.
// Returns std::nullopt if a '%' is not followed by two hexadecimal digits.
[[nodiscard]] std::optional<std::string> Decode(std::string_view encoded, PlusPolicy plusPolicy = PlusPolicy::Keep);

// Lenient variant: malformed escapes are kept literally.
[[nodiscard]] std::string DecodeLenient(std::string_view encoded, PlusPolicy plusPolicy = PlusPolicy::Keep);

// Splits an application/x-www-form-urlencoded string ("a=1&b=x+y") into decoded key / value pairs.
// Keys without '=' get an empty value, empty pairs ("a=1&&b=2") are skipped. Order is preserved.
[[nodiscard]] vector<std::pair<std::string, std::string>> ParseQueryString(std::string_view query);

}  // namespace ignyx::url

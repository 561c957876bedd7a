#pragma once

#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <optional>
#include <string>
#include <string_view>

namespace ignyx {

// Dynamic JSON document. Numbers are stored as double.
using Json = glz::json_t;

// Returns std::nullopt if 'text' is not a valid JSON document.
[[nodiscard]] std::optional<Json> ParseJson(std::string_view text);

[[nodiscard]] std::string DumpJson(const Json& value);

[[nodiscard]] Json JsonObject();

[[nodiscard]] Json JsonArray();

// Serializes any glaze-reflectable value (aggregates, glz::meta specializations, standard containers).
template <typename T>
[[nodiscard]] std::string SerializeToJson(const T& obj) {
  return glz::write_json(obj).value_or(std::string{});
}

}  // namespace ignyx

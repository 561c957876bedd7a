#include "ignyx/json.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace ignyx {

std::optional<Json> ParseJson(std::string_view text) {
  // glaze expects a null terminated buffer.
  const std::string buffer(text);
  Json value;
  if (auto ec = glz::read_json(value, buffer); ec) {
    return std::nullopt;
  }
  return value;
}

std::string DumpJson(const Json& value) { return glz::write_json(value).value_or(std::string{"null"}); }

Json JsonObject() {
  Json value;
  value.data = Json::object_t{};
  return value;
}

Json JsonArray() {
  Json value;
  value.data = Json::array_t{};
  return value;
}

}  // namespace ignyx

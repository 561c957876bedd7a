#include "ignyx/arguments.hpp"

#include <any>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "ignyx/json.hpp"
#include "ignyx/param-spec.hpp"

namespace ignyx {

const ParamValue& Arguments::value(std::string_view name) const {
  for (const auto& [paramName, paramValue] : _values) {
    if (paramName == name) {
      return paramValue;
    }
  }
  throw std::invalid_argument(std::format("Unknown argument '{}'", name));
}

bool Arguments::has(std::string_view name) const noexcept {
  for (const auto& [paramName, paramValue] : _values) {
    if (paramName == name) {
      return !std::holds_alternative<std::monostate>(paramValue);
    }
  }
  return false;
}

std::any& Arguments::dependencyValue(std::string_view name) {
  std::string_view identity = name;
  for (const ParamSpec& spec : _specs) {
    if (spec.source == ParamSource::Dependency && spec.name == name) {
      identity = spec.dependency;
      break;
    }
  }
  std::any* value = _context.cachedDependency(identity);
  if (value == nullptr) {
    throw std::invalid_argument(std::format("Dependency '{}' was not resolved for this handler", name));
  }
  return *value;
}

void Arguments::ThrowTypeMismatch(std::string_view name, std::string_view expected) {
  throw std::invalid_argument(std::format("Argument '{}' does not hold a {} value", name, expected));
}

Json Arguments::ToJson(const ParamValue& paramValue) {
  return std::visit(
      [](const auto& value) -> Json {
        using V = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<V, std::monostate>) {
          return Json{};
        } else if constexpr (std::is_same_v<V, int64_t>) {
          return Json(static_cast<double>(value));
        } else if constexpr (std::is_same_v<V, UploadFile>) {
          Json file = JsonObject();
          file["filename"] = value.filename;
          file["content_type"] = value.contentType;
          file["size"] = static_cast<double>(value.content.size());
          return file;
        } else {
          return Json(value);
        }
      },
      paramValue);
}

}  // namespace ignyx

#include "ignyx/param-spec.hpp"

#include <cmath>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/errors.hpp"
#include "ignyx/json.hpp"
#include "ignyx/shape.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

std::string_view ParamSourceLocation(ParamSource source) noexcept {
  switch (source) {
    case ParamSource::Path:
      return "path";
    case ParamSource::Query:
      return "query";
    case ParamSource::Header:
      return "header";
    case ParamSource::Cookie:
      return "cookie";
    case ParamSource::Body:
      [[fallthrough]];
    case ParamSource::Form:
      return "body";
    default:
      return "context";
  }
}

ParamValue ToParamValue(Json value, const Shape& shape) {
  if (value.is_null()) {
    return std::monostate{};
  }
  switch (shape.kind()) {
    case Shape::Kind::String:
      if (value.is_string()) {
        return std::move(value.get<std::string>());
      }
      break;
    case Shape::Kind::Integer:
      if (value.is_number() && std::fabs(value.get<double>()) <= static_cast<double>(kMaxJsonInteger)) {
        return static_cast<int64_t>(value.get<double>());
      }
      break;
    case Shape::Kind::Float:
      if (value.is_number()) {
        return value.get<double>();
      }
      break;
    case Shape::Kind::Boolean:
      if (value.is_boolean()) {
        return value.get<bool>();
      }
      break;
    default:
      break;
  }
  return value;
}

std::optional<ParamValue> CoerceParam(std::string_view text, const Shape& shape, std::span<const LocPart> loc,
                                      vector<FieldError>& errors) {
  if (shape.kind() == Shape::Kind::Integer) {
    if (auto value = ParseInteger(text)) {
      return ParamValue(*value);
    }
    errors.push_back(MakeFieldError(loc, errtype::kIntParsing, Json(std::string(text))));
    return std::nullopt;
  }
  if (auto value = CoerceText(text, shape, loc, errors)) {
    return ToParamValue(std::move(*value), shape);
  }
  return std::nullopt;
}

}  // namespace ignyx

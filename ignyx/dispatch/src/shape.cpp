#include "ignyx/shape.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "ignyx/errors.hpp"
#include "ignyx/json.hpp"
#include "ignyx/string-equal-ignore-case.hpp"
#include "ignyx/string-trim.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

namespace {

constexpr std::string_view kTrueTokens[] = {"1", "true", "t", "yes", "y", "on"};
constexpr std::string_view kFalseTokens[] = {"0", "false", "f", "no", "n", "off"};

void AddError(std::span<const LocPart> loc, errtype::ErrorType errorType, const Json& input,
              vector<FieldError>& errors) {
  errors.push_back(MakeFieldError(loc, errorType, input));
}

constexpr auto kMaxExactInteger = static_cast<double>(kMaxJsonInteger);

bool FitsJsonNumber(int64_t value) noexcept { return value >= -kMaxJsonInteger && value <= kMaxJsonInteger; }

std::optional<Json> ValidateInteger(const Json& input, std::span<const LocPart> loc, vector<FieldError>& errors) {
  if (input.is_number()) {
    const double value = input.get<double>();
    if (std::trunc(value) != value || std::fabs(value) > kMaxExactInteger) {
      AddError(loc, errtype::kIntFromFloat, input, errors);
      return std::nullopt;
    }
    return input;
  }
  if (input.is_string()) {
    if (auto parsed = ParseInteger(input.get<std::string>()); parsed && FitsJsonNumber(*parsed)) {
      return Json(static_cast<double>(*parsed));
    }
    AddError(loc, errtype::kIntParsing, input, errors);
    return std::nullopt;
  }
  AddError(loc, errtype::kIntType, input, errors);
  return std::nullopt;
}

std::optional<Json> ValidateFloat(const Json& input, std::span<const LocPart> loc, vector<FieldError>& errors) {
  if (input.is_number()) {
    return input;
  }
  if (input.is_string()) {
    if (auto parsed = ParseFloat(input.get<std::string>())) {
      return Json(*parsed);
    }
    AddError(loc, errtype::kFloatParsing, input, errors);
    return std::nullopt;
  }
  AddError(loc, errtype::kFloatType, input, errors);
  return std::nullopt;
}

std::optional<Json> ValidateBoolean(const Json& input, std::span<const LocPart> loc, vector<FieldError>& errors) {
  if (input.is_boolean()) {
    return input;
  }
  if (input.is_string()) {
    if (auto parsed = ParseBoolean(input.get<std::string>())) {
      return Json(*parsed);
    }
    AddError(loc, errtype::kBoolParsing, input, errors);
    return std::nullopt;
  }
  if (input.is_number()) {
    const double value = input.get<double>();
    if (value == 0.0 || value == 1.0) {
      return Json(value == 1.0);
    }
    AddError(loc, errtype::kBoolParsing, input, errors);
    return std::nullopt;
  }
  AddError(loc, errtype::kBoolType, input, errors);
  return std::nullopt;
}

}  // namespace

Shape Shape::Object(vector<Field> fields) {
  Shape shape(Kind::Object);
  shape._fields = std::make_shared<const vector<Field>>(std::move(fields));
  return shape;
}

Shape Shape::Array(Shape element) {
  Shape shape(Kind::Array);
  shape._element = std::make_shared<const Shape>(std::move(element));
  return shape;
}

std::span<const Shape::Field> Shape::fields() const noexcept {
  if (!_fields) {
    return {};
  }
  return {_fields->data(), _fields->size()};
}

std::string_view Shape::kindName() const noexcept {
  switch (_kind) {
    case Kind::String:
      return "string";
    case Kind::Integer:
      return "integer";
    case Kind::Float:
      return "number";
    case Kind::Boolean:
      return "boolean";
    case Kind::Json:
      return "json";
    case Kind::Object:
      return "object";
    case Kind::Array:
      return "array";
    case Kind::File:
      return "file";
    default:
      return "unknown";
  }
}

std::optional<int64_t> ParseInteger(std::string_view text) noexcept {
  text = Trim(text);
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
    if (!text.empty() && text.front() == '-') {
      return std::nullopt;
    }
  }
  if (text.empty()) {
    return std::nullopt;
  }
  int64_t value{};
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> ParseFloat(std::string_view text) noexcept {
  text = Trim(text);
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return std::nullopt;
  }
  double value{};
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<bool> ParseBoolean(std::string_view text) noexcept {
  text = Trim(text);
  for (std::string_view token : kTrueTokens) {
    if (CaseInsensitiveEqual(text, token)) {
      return true;
    }
  }
  for (std::string_view token : kFalseTokens) {
    if (CaseInsensitiveEqual(text, token)) {
      return false;
    }
  }
  return std::nullopt;
}

FieldError MakeFieldError(std::span<const LocPart> loc, errtype::ErrorType errorType, Json input) {
  FieldError error;
  error.loc = vector<LocPart>(loc.begin(), loc.end());
  error.msg = errorType.msg;
  error.type = errorType.type;
  error.input = std::move(input);
  return error;
}

std::optional<Json> CoerceText(std::string_view text, const Shape& shape, std::span<const LocPart> loc,
                               vector<FieldError>& errors) {
  switch (shape.kind()) {
    case Shape::Kind::Integer:
      if (auto value = ParseInteger(text); value && FitsJsonNumber(*value)) {
        return Json(static_cast<double>(*value));
      }
      AddError(loc, errtype::kIntParsing, Json(std::string(text)), errors);
      return std::nullopt;
    case Shape::Kind::Float:
      if (auto value = ParseFloat(text)) {
        return Json(*value);
      }
      AddError(loc, errtype::kFloatParsing, Json(std::string(text)), errors);
      return std::nullopt;
    case Shape::Kind::Boolean:
      if (auto value = ParseBoolean(text)) {
        return Json(*value);
      }
      AddError(loc, errtype::kBoolParsing, Json(std::string(text)), errors);
      return std::nullopt;
    case Shape::Kind::Json:
      // Structured values may be sent as JSON text, anything else is kept as a string.
      if (auto parsed = ParseJson(text)) {
        return parsed;
      }
      return Json(std::string(text));
    case Shape::Kind::Object:
      AddError(loc, errtype::kDictType, Json(std::string(text)), errors);
      return std::nullopt;
    case Shape::Kind::Array:
      AddError(loc, errtype::kListType, Json(std::string(text)), errors);
      return std::nullopt;
    default:
      return Json(std::string(text));
  }
}

std::optional<Json> ValidateJson(const Json& input, const Shape& shape, vector<LocPart>& loc,
                                 vector<FieldError>& errors) {
  const std::span<const LocPart> here(loc.data(), loc.size());
  switch (shape.kind()) {
    case Shape::Kind::String:
    case Shape::Kind::File:
      if (input.is_string()) {
        return input;
      }
      AddError(here, errtype::kStringType, input, errors);
      return std::nullopt;
    case Shape::Kind::Integer:
      return ValidateInteger(input, here, errors);
    case Shape::Kind::Float:
      return ValidateFloat(input, here, errors);
    case Shape::Kind::Boolean:
      return ValidateBoolean(input, here, errors);
    case Shape::Kind::Json:
      return input;
    case Shape::Kind::Array: {
      if (!input.is_array()) {
        AddError(here, errtype::kListType, input, errors);
        return std::nullopt;
      }
      Json out = JsonArray();
      bool allValid = true;
      const auto& elements = input.get_array();
      for (std::size_t idx = 0; idx < elements.size(); ++idx) {
        loc.emplace_back(static_cast<int64_t>(idx));
        auto element = ValidateJson(elements[idx], shape.element(), loc, errors);
        loc.pop_back();
        if (element) {
          out.get_array().push_back(std::move(*element));
        } else {
          allValid = false;
        }
      }
      if (!allValid) {
        return std::nullopt;
      }
      return out;
    }
    case Shape::Kind::Object: {
      if (!input.is_object()) {
        AddError(here, errtype::kDictType, input, errors);
        return std::nullopt;
      }
      Json out = JsonObject();
      bool allValid = true;
      const auto& members = input.get_object();
      for (const Shape::Field& field : shape.fields()) {
        auto it = members.find(field.name);
        loc.emplace_back(field.name);
        if (it == members.end() || (it->second.is_null() && !field.required)) {
          if (field.required) {
            errors.push_back(MakeFieldError({loc.data(), loc.size()}, errtype::kMissing, input));
            allValid = false;
          } else {
            out[field.name] = field.defaultValue;
          }
        } else if (auto value = ValidateJson(it->second, field.shape, loc, errors)) {
          out[field.name] = std::move(*value);
        } else {
          allValid = false;
        }
        loc.pop_back();
      }
      if (!allValid) {
        return std::nullopt;
      }
      return out;
    }
    default:
      return input;
  }
}

}  // namespace ignyx

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

#include "ignyx/json.hpp"
#include "ignyx/errors.hpp"
#include "ignyx/shape.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

// Where the value of a handler parameter comes from.
enum class ParamSource : uint8_t { Path, Query, Header, Cookie, Body, Form, Dependency, Context };

// Engine objects that can be injected into a handler.
enum class ContextKind : uint8_t { Request, BackgroundTasks };

// Leading element of the error location of a parameter ("path", "query", ...). Form fields live in the body.
[[nodiscard]] std::string_view ParamSourceLocation(ParamSource source) noexcept;

// File part of a multipart form.
struct UploadFile {
  std::string filename;
  std::string contentType;
  std::string content;

  [[nodiscard]] std::size_t size() const noexcept { return content.size(); }
};

// Resolved value of a parameter. Scalars are stored natively, structured values as Json.
using ParamValue = std::variant<std::monostate, std::string, int64_t, double, bool, Json, UploadFile>;

// Converts a validated JSON value to the native representation of 'shape'.
[[nodiscard]] ParamValue ToParamValue(Json value, const Shape& shape);

// Coerces a textual scalar parameter straight to its native representation, so that integers keep the whole
// int64 range. Errors are reported as by CoerceText.
std::optional<ParamValue> CoerceParam(std::string_view text, const Shape& shape, std::span<const LocPart> loc,
                                      vector<FieldError>& errors);

struct ParamSpec {
  std::string name;
  ParamSource source{ParamSource::Query};
  Shape shape;
  bool required{true};
  // Value used when the parameter is absent and not required (null by default).
  Json defaultValue;
  // Name on the wire when it differs from 'name' (header names for instance).
  std::string alias;
  // Dependency identity, for ParamSource::Dependency.
  std::string dependency;
  // For ParamSource::Context.
  ContextKind contextKind{ContextKind::Request};

  [[nodiscard]] std::string_view wireName() const noexcept { return alias.empty() ? name : alias; }
};

}  // namespace ignyx

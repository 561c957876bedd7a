#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "ignyx/errors.hpp"
#include "ignyx/json.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

// Declared type of a parameter or of a body field.
// Objects and arrays nest: a shape is a small immutable tree, cheap to copy (children are shared).
class Shape {
 public:
  enum class Kind : uint8_t { String, Integer, Float, Boolean, Json, Object, Array, File };

  struct Field;

  Shape() noexcept = default;

  static Shape String() noexcept { return Shape(Kind::String); }
  static Shape Integer() noexcept { return Shape(Kind::Integer); }
  static Shape Float() noexcept { return Shape(Kind::Float); }
  static Shape Boolean() noexcept { return Shape(Kind::Boolean); }
  // Any JSON value, accepted without validation.
  static Shape AnyJson() noexcept { return Shape(Kind::Json); }
  // Uploaded file of a multipart form.
  static Shape File() noexcept { return Shape(Kind::File); }

  static Shape Object(vector<Field> fields);

  static Shape Array(Shape element);

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

  [[nodiscard]] bool isScalar() const noexcept { return _kind <= Kind::Boolean; }

  // Only for Object shapes.
  [[nodiscard]] std::span<const Field> fields() const noexcept;

  // Only for Array shapes.
  [[nodiscard]] const Shape& element() const noexcept { return *_element; }

  [[nodiscard]] std::string_view kindName() const noexcept;

 private:
  explicit Shape(Kind kind) noexcept : _kind(kind) {}

  Kind _kind{Kind::String};
  std::shared_ptr<const vector<Field>> _fields;
  std::shared_ptr<const Shape> _element;
};

struct Shape::Field {
  std::string name;
  Shape shape;
  bool required{true};
  // Used when the field is absent and not required.
  Json defaultValue;
};

// Largest magnitude of an integer carried inside a Json value (numbers are doubles) without loss.
inline constexpr int64_t kMaxJsonInteger = int64_t{1} << 53;

// Textual coercions shared by path, query, header, cookie and form values.
// Integers are base 10 with an optional sign, surrounding whitespace is ignored.
[[nodiscard]] std::optional<int64_t> ParseInteger(std::string_view text) noexcept;

// Decimal and exponent forms, "inf" and "nan".
[[nodiscard]] std::optional<double> ParseFloat(std::string_view text) noexcept;

// "1 true t yes y on" and "0 false f no n off", case-insensitive.
[[nodiscard]] std::optional<bool> ParseBoolean(std::string_view text) noexcept;

// Converts a textual value to a JSON value of the given scalar (or Json) shape.
// Integers beyond kMaxJsonInteger are int_parsing errors here: scalar parameters that need the full int64 range
// go through CoerceParam instead.
// On failure, appends an error located at 'loc' to 'errors' and returns std::nullopt.
std::optional<Json> CoerceText(std::string_view text, const Shape& shape, std::span<const LocPart> loc,
                               vector<FieldError>& errors);

// Validates (and coerces, in lax mode: "42" is accepted for an integer) a decoded JSON value against 'shape',
// recursively. Errors are accumulated with their full location, starting with 'loc'.
// Missing optional object fields are filled with their default.
std::optional<Json> ValidateJson(const Json& input, const Shape& shape, vector<LocPart>& loc,
                                 vector<FieldError>& errors);

namespace errtype {

struct ErrorType {
  std::string_view type;
  std::string_view msg;
};

inline constexpr ErrorType kMissing{"missing", "Field required"};
inline constexpr ErrorType kIntParsing{"int_parsing",
                                       "Input should be a valid integer, unable to parse string as an integer"};
inline constexpr ErrorType kFloatParsing{"float_parsing",
                                         "Input should be a valid number, unable to parse string as a number"};
inline constexpr ErrorType kBoolParsing{"bool_parsing", "Input should be a valid boolean, unable to interpret input"};
inline constexpr ErrorType kStringType{"string_type", "Input should be a valid string"};
inline constexpr ErrorType kIntType{"int_type", "Input should be a valid integer"};
inline constexpr ErrorType kIntFromFloat{"int_from_float",
                                         "Input should be a valid integer, got a number with a fractional part"};
inline constexpr ErrorType kFloatType{"float_type", "Input should be a valid number"};
inline constexpr ErrorType kBoolType{"bool_type", "Input should be a valid boolean"};
inline constexpr ErrorType kDictType{"dict_type", "Input should be a valid dictionary"};
inline constexpr ErrorType kListType{"list_type", "Input should be a valid list"};
inline constexpr ErrorType kJsonInvalid{"json_invalid", "JSON decode error"};

}  // namespace errtype

[[nodiscard]] FieldError MakeFieldError(std::span<const LocPart> loc, errtype::ErrorType errorType, Json input);

}  // namespace ignyx

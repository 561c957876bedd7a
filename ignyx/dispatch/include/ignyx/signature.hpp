#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "ignyx/json.hpp"
#include "ignyx/param-spec.hpp"
#include "ignyx/shape.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

// Declares the parameters of a handler, in order. Absent 'defaultValue' means the parameter is required,
// a null default makes it optional without value.
//
//   Signature().path("user_id", Shape::Integer()).query("verbose", Shape::Boolean(), Json(false)).depends("db")
class Signature {
 public:
  Signature& path(std::string name, Shape shape = Shape::String());

  Signature& query(std::string name, Shape shape = Shape::String(), std::optional<Json> defaultValue = std::nullopt);

  // Header names default to the parameter name with '_' replaced by '-' ("user_agent" reads User-Agent).
  Signature& header(std::string name, Shape shape = Shape::String(), std::optional<Json> defaultValue = std::nullopt);

  Signature& cookie(std::string name, Shape shape = Shape::String(), std::optional<Json> defaultValue = std::nullopt);

  // Field of a form body (urlencoded or multipart). Shape::File() receives an UploadFile.
  Signature& form(std::string name, Shape shape = Shape::String(), std::optional<Json> defaultValue = std::nullopt);

  // JSON body. With a single body parameter the whole document is validated against 'shape', with several of
  // them the document must be an object holding one member per parameter.
  Signature& body(std::string name, Shape shape, std::optional<Json> defaultValue = std::nullopt);

  // Dependency injected under its own name.
  Signature& depends(std::string dependencyName);

  Signature& depends(std::string name, std::string dependencyName);

  // The HttpRequest itself.
  Signature& request(std::string name = "request");

  Signature& backgroundTasks(std::string name = "background_tasks");

  // Wire name of the last declared parameter.
  Signature& alias(std::string wireName);

  [[nodiscard]] std::span<const ParamSpec> params() const noexcept { return {_params.data(), _params.size()}; }

  [[nodiscard]] bool empty() const noexcept { return _params.empty(); }

 private:
  Signature& add(ParamSpec spec, std::optional<Json> defaultValue);

  vector<ParamSpec> _params;
};

}  // namespace ignyx

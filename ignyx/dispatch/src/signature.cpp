#include "ignyx/signature.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "ignyx/json.hpp"
#include "ignyx/param-spec.hpp"
#include "ignyx/shape.hpp"

namespace ignyx {

Signature& Signature::add(ParamSpec spec, std::optional<Json> defaultValue) {
  if (defaultValue) {
    spec.required = false;
    spec.defaultValue = std::move(*defaultValue);
  }
  _params.push_back(std::move(spec));
  return *this;
}

Signature& Signature::path(std::string name, Shape shape) {
  ParamSpec spec;
  spec.name = std::move(name);
  spec.source = ParamSource::Path;
  spec.shape = std::move(shape);
  return add(std::move(spec), std::nullopt);
}

Signature& Signature::query(std::string name, Shape shape, std::optional<Json> defaultValue) {
  ParamSpec spec;
  spec.name = std::move(name);
  spec.source = ParamSource::Query;
  spec.shape = std::move(shape);
  return add(std::move(spec), std::move(defaultValue));
}

Signature& Signature::header(std::string name, Shape shape, std::optional<Json> defaultValue) {
  ParamSpec spec;
  spec.alias = name;
  std::ranges::replace(spec.alias, '_', '-');
  spec.name = std::move(name);
  spec.source = ParamSource::Header;
  spec.shape = std::move(shape);
  return add(std::move(spec), std::move(defaultValue));
}

Signature& Signature::cookie(std::string name, Shape shape, std::optional<Json> defaultValue) {
  ParamSpec spec;
  spec.name = std::move(name);
  spec.source = ParamSource::Cookie;
  spec.shape = std::move(shape);
  return add(std::move(spec), std::move(defaultValue));
}

Signature& Signature::form(std::string name, Shape shape, std::optional<Json> defaultValue) {
  ParamSpec spec;
  spec.name = std::move(name);
  spec.source = ParamSource::Form;
  spec.shape = std::move(shape);
  return add(std::move(spec), std::move(defaultValue));
}

Signature& Signature::body(std::string name, Shape shape, std::optional<Json> defaultValue) {
  ParamSpec spec;
  spec.name = std::move(name);
  spec.source = ParamSource::Body;
  spec.shape = std::move(shape);
  return add(std::move(spec), std::move(defaultValue));
}

Signature& Signature::depends(std::string dependencyName) {
  std::string name = dependencyName;
  return depends(std::move(name), std::move(dependencyName));
}

Signature& Signature::depends(std::string name, std::string dependencyName) {
  ParamSpec spec;
  spec.name = std::move(name);
  spec.source = ParamSource::Dependency;
  spec.dependency = std::move(dependencyName);
  return add(std::move(spec), std::nullopt);
}

Signature& Signature::request(std::string name) {
  ParamSpec spec;
  spec.name = std::move(name);
  spec.source = ParamSource::Context;
  spec.contextKind = ContextKind::Request;
  return add(std::move(spec), std::nullopt);
}

Signature& Signature::backgroundTasks(std::string name) {
  ParamSpec spec;
  spec.name = std::move(name);
  spec.source = ParamSource::Context;
  spec.contextKind = ContextKind::BackgroundTasks;
  return add(std::move(spec), std::nullopt);
}

Signature& Signature::alias(std::string wireName) {
  if (_params.empty()) {
    throw std::logic_error("alias() must follow a parameter declaration");
  }
  _params.back().alias = std::move(wireName);
  return *this;
}

}  // namespace ignyx

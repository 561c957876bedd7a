#include "ignyx/handler-descriptor.hpp"

#include <algorithm>
#include <format>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "ignyx/dependency.hpp"
#include "ignyx/param-spec.hpp"
#include "ignyx/path-template.hpp"
#include "ignyx/shape.hpp"
#include "ignyx/signature.hpp"

namespace ignyx {

namespace {

bool IsTextualShape(const Shape& shape, bool allowArray) {
  if (shape.isScalar() || shape.kind() == Shape::Kind::Json) {
    return true;
  }
  return allowArray && shape.kind() == Shape::Kind::Array && shape.element().isScalar();
}

}  // namespace

HandlerDescriptor::HandlerDescriptor(std::string_view pattern, const Signature& signature, Handler handler,
                                     std::string name)
    : _pattern(pattern), _name(std::move(name)), _handler(std::move(handler)) {
  const bool hasHandler = std::visit([](const auto& fn) { return static_cast<bool>(fn); }, _handler);
  if (!hasHandler) {
    throw std::invalid_argument(std::format("Route {} has an empty handler", pattern));
  }

  const PathTemplate compiled = PathTemplate::Compile(pattern);
  const auto placeholders = compiled.paramNames();

  std::span<const ParamSpec> specs = signature.params();
  _params = vector<ParamSpec>(specs.begin(), specs.end());

  uint32_t nbPathParams = 0;
  for (std::size_t paramPos = 0; paramPos < _params.size(); ++paramPos) {
    const ParamSpec& spec = _params[paramPos];
    if (spec.name.empty()) {
      throw std::invalid_argument(std::format("Route {}: parameter #{} has no name", pattern, paramPos));
    }
    for (std::size_t otherPos = 0; otherPos < paramPos; ++otherPos) {
      if (_params[otherPos].name == spec.name) {
        throw std::invalid_argument(std::format("Route {}: duplicate parameter '{}'", pattern, spec.name));
      }
    }
    switch (spec.source) {
      case ParamSource::Path:
        if (std::ranges::find(placeholders, spec.wireName()) == placeholders.end()) {
          throw std::invalid_argument(
              std::format("Route {}: path parameter '{}' has no placeholder in the template", pattern, spec.name));
        }
        if (!spec.shape.isScalar()) {
          throw std::invalid_argument(std::format("Route {}: path parameter '{}' must be a scalar", pattern, spec.name));
        }
        ++nbPathParams;
        break;
      case ParamSource::Query:
        [[fallthrough]];
      case ParamSource::Header:
        [[fallthrough]];
      case ParamSource::Cookie:
        if (!IsTextualShape(spec.shape, spec.source != ParamSource::Cookie)) {
          throw std::invalid_argument(
              std::format("Route {}: {} parameter '{}' cannot be of {} shape", pattern,
                          ParamSourceLocation(spec.source), spec.name, spec.shape.kindName()));
        }
        break;
      case ParamSource::Body:
        ++_nbBodyParams;
        break;
      case ParamSource::Form:
        _readsForm = true;
        break;
      case ParamSource::Dependency:
        if (spec.dependency.empty()) {
          throw std::invalid_argument(std::format("Route {}: parameter '{}' depends on nothing", pattern, spec.name));
        }
        if (std::ranges::find(_dependencyRoots, spec.dependency) == _dependencyRoots.end()) {
          _dependencyRoots.push_back(spec.dependency);
        }
        break;
      default:
        break;
    }
  }
  if (nbPathParams != placeholders.size()) {
    for (const std::string& placeholder : placeholders) {
      const bool declared = std::ranges::any_of(_params, [&placeholder](const ParamSpec& spec) {
        return spec.source == ParamSource::Path && spec.wireName() == placeholder;
      });
      if (!declared) {
        throw std::invalid_argument(
            std::format("Route {}: placeholder '{}' has no path parameter", pattern, placeholder));
      }
    }
  }
  if (_nbBodyParams != 0 && _readsForm) {
    throw std::invalid_argument(std::format("Route {}: JSON body and form parameters cannot be mixed", pattern));
  }
}

void HandlerDescriptor::checkDependencies(const DependencyRegistry& registry) const {
  try {
    [[maybe_unused]] const auto plan = registry.plan(dependencyRoots());
  } catch (const std::invalid_argument& ex) {
    throw std::invalid_argument(std::format("Route {}: {}", _pattern, ex.what()));
  }
}

}  // namespace ignyx

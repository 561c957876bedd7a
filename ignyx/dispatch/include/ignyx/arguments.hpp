#pragma once

#include <any>
#include <concepts>
#include <cstdint>
#include <format>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "ignyx/background-tasks.hpp"
#include "ignyx/cookie.hpp"
#include "ignyx/http-headers.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/json.hpp"
#include "ignyx/param-spec.hpp"
#include "ignyx/request-context.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

// Resolved parameters of one handler invocation, plus access to the request context.
// Values are fetched by parameter name and converted to the requested C++ type:
//   - int64_t / integral types, double, bool, std::string, UploadFile for scalar shapes,
//   - Json for any value,
//   - any glaze-reflectable aggregate for object shapes.
class Arguments {
 public:
  Arguments(RequestContext& context, std::span<const ParamSpec> specs) noexcept : _context(context), _specs(specs) {}

  Arguments(const Arguments&) = delete;
  Arguments& operator=(const Arguments&) = delete;

  void set(std::string name, ParamValue value) { _values.emplace_back(std::move(name), std::move(value)); }

  // Throws std::invalid_argument if 'name' is not a resolved parameter.
  [[nodiscard]] const ParamValue& value(std::string_view name) const;

  // True if the parameter was provided or has a non null default.
  [[nodiscard]] bool has(std::string_view name) const noexcept;

  // Throws std::invalid_argument if 'name' is unknown or if its value cannot be represented as a T.
  template <class T>
  [[nodiscard]] T get(std::string_view name) const {
    return Convert<T>(name, value(name));
  }

  // Same as get(), std::nullopt for an absent optional parameter.
  template <class T>
  [[nodiscard]] std::optional<T> getOptional(std::string_view name) const {
    const ParamValue& paramValue = value(name);
    if (std::holds_alternative<std::monostate>(paramValue)) {
      return std::nullopt;
    }
    return Convert<T>(name, paramValue);
  }

  // Value of dependency parameter 'name' (or, if there is no such parameter, of the dependency identity 'name').
  // Throws std::bad_any_cast if the provider returned something else than a T.
  template <class T>
  [[nodiscard]] T& dependency(std::string_view name) {
    return std::any_cast<T&>(dependencyValue(name));
  }

  [[nodiscard]] std::any& dependencyValue(std::string_view name);

  [[nodiscard]] HttpRequest& request() noexcept { return _context.request(); }

  [[nodiscard]] BackgroundTasks& backgroundTasks() noexcept { return _context.backgroundTasks(); }

  [[nodiscard]] RequestContext& context() noexcept { return _context; }

  // Cookie directives to attach to the response, whatever the handler returns.
  void setCookie(Cookie cookie) { _cookies.push_back(std::move(cookie)); }

  void deleteCookie(std::string name, std::string path = "/") {
    _cookies.push_back(Cookie::Deletion(std::move(name), std::move(path)));
  }

  [[nodiscard]] std::span<const Cookie> cookies() const noexcept { return {_cookies.data(), _cookies.size()}; }

  // Headers to add to the response (tuple form headers and explicit responses win on conflict).
  [[nodiscard]] HeaderMap& responseHeaders() noexcept { return _responseHeaders; }
  [[nodiscard]] const HeaderMap& responseHeaders() const noexcept { return _responseHeaders; }

 private:
  [[noreturn]] static void ThrowTypeMismatch(std::string_view name, std::string_view expected);

  static Json ToJson(const ParamValue& paramValue);

  template <class T>
  static T Convert(std::string_view name, const ParamValue& paramValue) {
    if constexpr (std::is_same_v<T, Json>) {
      return ToJson(paramValue);
    } else if constexpr (std::is_same_v<T, ParamValue>) {
      return paramValue;
    } else if constexpr (std::is_same_v<T, bool>) {
      if (const auto* ptr = std::get_if<bool>(&paramValue)) {
        return *ptr;
      }
      ThrowTypeMismatch(name, "boolean");
    } else if constexpr (std::integral<T>) {
      if (const auto* ptr = std::get_if<int64_t>(&paramValue)) {
        return static_cast<T>(*ptr);
      }
      ThrowTypeMismatch(name, "integer");
    } else if constexpr (std::floating_point<T>) {
      if (const auto* ptr = std::get_if<double>(&paramValue)) {
        return static_cast<T>(*ptr);
      }
      if (const auto* ptr = std::get_if<int64_t>(&paramValue)) {
        return static_cast<T>(*ptr);
      }
      ThrowTypeMismatch(name, "number");
    } else if constexpr (std::is_same_v<T, std::string>) {
      if (const auto* ptr = std::get_if<std::string>(&paramValue)) {
        return *ptr;
      }
      ThrowTypeMismatch(name, "string");
    } else if constexpr (std::is_same_v<T, UploadFile>) {
      if (const auto* ptr = std::get_if<UploadFile>(&paramValue)) {
        return *ptr;
      }
      ThrowTypeMismatch(name, "file");
    } else {
      // Structured value read into a glaze-reflectable type.
      T obj{};
      const std::string buffer = DumpJson(ToJson(paramValue));
      if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(obj, buffer); ec) {
        throw std::invalid_argument(
            std::format("Argument '{}' cannot be read into the requested type: {}", name, glz::format_error(ec, buffer)));
      }
      return obj;
    }
  }

  RequestContext& _context;
  std::span<const ParamSpec> _specs;
  vector<std::pair<std::string, ParamValue>> _values;
  vector<Cookie> _cookies;
  HeaderMap _responseHeaders;
};

}  // namespace ignyx

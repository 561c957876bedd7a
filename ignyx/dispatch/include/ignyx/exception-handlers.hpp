#pragma once

#include <concepts>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include "ignyx/flat-hash-map.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

using ExceptionHandler = std::function<HttpResponse(const HttpRequest&, const std::exception&)>;

// Converts request-time exceptions into responses. Lookup order:
//   1. handler registered for the exact dynamic type of the exception,
//   2. first handler (in registration order) registered for a base class of it,
//   3. handler registered for the status associated to the exception (see StatusOf),
//   4. built-in rendering.
// A user handler that throws is logged and replaced by the built-in rendering of its own exception.
class ExceptionHandlers {
 public:
  template <class E>
    requires std::derived_from<E, std::exception>
  void add(std::function<HttpResponse(const HttpRequest&, const E&)> handler) {
    _typeHandlers.push_back(TypeEntry{
        std::type_index(typeid(E)), [handler = std::move(handler)](const HttpRequest& request,
                                                                   const std::exception& ex) -> std::optional<HttpResponse> {
          if (const auto* typed = dynamic_cast<const E*>(&ex)) {
            return handler(request, *typed);
          }
          return std::nullopt;
        }});
  }

  void addStatus(http::StatusCode status, ExceptionHandler handler);

  // Exceptions without any registered handler reveal their message and chain in 500 responses.
  void setDebug(bool debug) noexcept { _debug = debug; }

  [[nodiscard]] bool debug() const noexcept { return _debug; }

  // 'error' must hold a std::exception (see CaptureUserException).
  [[nodiscard]] HttpResponse handle(const HttpRequest& request, std::exception_ptr error) const;

  // Built-in rendering: {"detail": ...} for HttpException, 422 with the error list for ValidationError,
  // 503 for LockTimeout and 500 for anything else.
  [[nodiscard]] static HttpResponse DefaultResponse(const std::exception& ex, bool debug);

 private:
  struct TypeEntry {
    std::type_index type;
    std::function<std::optional<HttpResponse>(const HttpRequest&, const std::exception&)> tryHandle;
  };

  [[nodiscard]] std::optional<HttpResponse> userResponse(const HttpRequest& request, const std::exception& ex) const;

  vector<TypeEntry> _typeHandlers;
  flat_hash_map<http::StatusCode, ExceptionHandler> _statusHandlers;
  bool _debug{false};
};

}  // namespace ignyx

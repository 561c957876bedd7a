#include "ignyx/middleware.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <typeinfo>
#include <utility>

#include "ignyx/call-bridge.hpp"
#include "ignyx/demangle.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/log.hpp"

namespace ignyx {

void MiddlewareChain::runBefore(HttpRequest& request, BeforeOutcome& outcome) const {
  for (const MiddlewareEntry& entry : _entries) {
    if (!entry.before) {
      ++outcome.nbEntered;
      continue;
    }
    MiddlewareResult result = entry.before(request);
    ++outcome.nbEntered;
    if (result.shouldShortCircuit()) {
      log::debug("Middleware '{}' short-circuited {}", entry.name, request.path());
      outcome.shortCircuit.emplace(std::move(result).takeResponse());
      return;
    }
  }
}

void MiddlewareChain::runAfter(const HttpRequest& request, HttpResponse& response, std::size_t nbEntered,
                               const std::function<HttpResponse(std::exception_ptr)>& renderError) const {
  for (std::size_t pos = nbEntered; pos > 0; --pos) {
    const MiddlewareEntry& entry = _entries[pos - 1];
    if (!entry.after) {
      continue;
    }
    try {
      entry.after(request, response);
    } catch (...) {
      std::exception_ptr error = CaptureUserException();
      log::warn("After-hook of middleware '{}' failed", entry.name);
      if (auto replacement = runOnError(request, error, pos - 1)) {
        response = std::move(*replacement);
      } else {
        response = renderError(error);
      }
    }
  }
}

std::optional<HttpResponse> MiddlewareChain::runOnError(const HttpRequest& request, std::exception_ptr error,
                                                        std::size_t nbEntered) const {
  for (std::size_t pos = nbEntered; pos > 0; --pos) {
    const MiddlewareEntry& entry = _entries[pos - 1];
    if (!entry.onError) {
      continue;
    }
    try {
      std::rethrow_exception(error);
    } catch (const std::exception& ex) {
      try {
        if (auto response = entry.onError(request, ex)) {
          log::debug("Middleware '{}' handled {}", entry.name, DemangledName(typeid(ex)));
          return response;
        }
      } catch (const std::exception& hookError) {
        log::error("On-error hook of middleware '{}' failed: {}", entry.name, hookError.what());
      }
    }
  }
  return std::nullopt;
}

}  // namespace ignyx

#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <utility>

#include "ignyx/http-request.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

// Result of running a middleware before-hook.
class MiddlewareResult {
 public:
  enum class Decision : std::uint8_t { Continue, ShortCircuit };

  // Synonym of MiddlewareResult::Continue().
  MiddlewareResult() noexcept = default;

  // Short-circuits the chain with the given response.
  explicit MiddlewareResult(HttpResponse response) noexcept
      : _decision(Decision::ShortCircuit), _response(std::move(response)) {}

  static MiddlewareResult Continue() noexcept { return {}; }

  static MiddlewareResult ShortCircuit(HttpResponse response) noexcept { return MiddlewareResult{std::move(response)}; }

  [[nodiscard]] bool shouldContinue() const noexcept { return _decision == Decision::Continue; }

  [[nodiscard]] bool shouldShortCircuit() const noexcept { return _decision == Decision::ShortCircuit; }

  [[nodiscard]] HttpResponse&& takeResponse() && noexcept { return std::move(_response); }

 private:
  Decision _decision{Decision::Continue};
  HttpResponse _response;
};

// Invoked before routing. It may mutate the request or short-circuit with a response, skipping the handler and
// the following before-hooks.
using RequestMiddleware = std::function<MiddlewareResult(HttpRequest&)>;

// Invoked on the way out, in reverse registration order. It can amend status, headers and body.
using ResponseMiddleware = std::function<void(const HttpRequest&, HttpResponse&)>;

// Invoked innermost-first when a handler or a hook fails. Returning a response stops the propagation.
using ErrorMiddleware = std::function<std::optional<HttpResponse>(const HttpRequest&, const std::exception&)>;

// One layer of the onion. Each hook is optional.
struct MiddlewareEntry {
  std::string name;
  RequestMiddleware before;
  ResponseMiddleware after;
  ErrorMiddleware onError;
};

// Ordered middleware layers. Immutable once the dispatcher is frozen, all methods are then safe to call
// concurrently (hooks themselves always run under the call-lock).
class MiddlewareChain {
 public:
  struct BeforeOutcome {
    // Number of layers whose before-hook completed (or short-circuited).
    std::size_t nbEntered{0};
    std::optional<HttpResponse> shortCircuit;
  };

  void add(MiddlewareEntry entry) { _entries.push_back(std::move(entry)); }

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  [[nodiscard]] std::span<const MiddlewareEntry> entries() const noexcept { return {_entries.data(), _entries.size()}; }

  // Runs before-hooks in registration order. 'outcome.nbEntered' is kept up to date, so that it is meaningful
  // when a hook throws: the failing layer is not counted as entered.
  void runBefore(HttpRequest& request, BeforeOutcome& outcome) const;

  // Runs after-hooks of layers [0, nbEntered) in reverse order. An after-hook failure is first offered to the
  // on-error hooks of the outer layers, then to 'renderError', and the remaining after-hooks run on the result.
  void runAfter(const HttpRequest& request, HttpResponse& response, std::size_t nbEntered,
                const std::function<HttpResponse(std::exception_ptr)>& renderError) const;

  // Offers 'error' to the on-error hooks of layers [0, nbEntered), innermost first.
  [[nodiscard]] std::optional<HttpResponse> runOnError(const HttpRequest& request, std::exception_ptr error,
                                                       std::size_t nbEntered) const;

 private:
  vector<MiddlewareEntry> _entries;
};

}  // namespace ignyx

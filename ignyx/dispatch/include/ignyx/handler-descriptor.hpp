#pragma once

#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <variant>

#include "ignyx/arguments.hpp"
#include "ignyx/dependency.hpp"
#include "ignyx/handler-result.hpp"
#include "ignyx/handler-task.hpp"
#include "ignyx/param-spec.hpp"
#include "ignyx/signature.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

// Runs to completion under the call-lock.
using SyncHandler = std::function<HandlerResult(Arguments&)>;

// May suspend on engine awaitables, releasing the call-lock meanwhile.
using AsyncHandler = std::function<HandlerTask<HandlerResult>(Arguments&)>;

using Handler = std::variant<SyncHandler, AsyncHandler>;

// Immutable description of a registered handler, computed once at registration and shared by every request
// routed to it.
class HandlerDescriptor {
 public:
  // Throws std::invalid_argument if the signature does not fit 'pattern': path parameters must match the
  // template placeholders one to one, names must be unique, body and form parameters cannot be mixed and query,
  // header or cookie parameters must be scalars (or arrays of scalars for query parameters).
  HandlerDescriptor(std::string_view pattern, const Signature& signature, Handler handler, std::string name = {});

  [[nodiscard]] std::span<const ParamSpec> params() const noexcept { return {_params.data(), _params.size()}; }

  [[nodiscard]] const Handler& handler() const noexcept { return _handler; }

  [[nodiscard]] bool isAsync() const noexcept { return std::holds_alternative<AsyncHandler>(_handler); }

  // True when several body parameters are declared: each one is a member of the JSON body object.
  [[nodiscard]] bool embedsBody() const noexcept { return _nbBodyParams > 1; }

  [[nodiscard]] bool readsBody() const noexcept { return _nbBodyParams != 0; }

  [[nodiscard]] bool readsForm() const noexcept { return _readsForm; }

  // Dependency identities referenced directly by the parameters, in declaration order.
  [[nodiscard]] std::span<const std::string> dependencyRoots() const noexcept {
    return {_dependencyRoots.data(), _dependencyRoots.size()};
  }

  // Checks that the referenced dependencies exist and form no cycle.
  void checkDependencies(const DependencyRegistry& registry) const;

  [[nodiscard]] std::string_view pattern() const noexcept { return _pattern; }

  [[nodiscard]] std::string_view name() const noexcept { return _name; }

 private:
  std::string _pattern;
  std::string _name;
  vector<ParamSpec> _params;
  vector<std::string> _dependencyRoots;
  Handler _handler;
  uint32_t _nbBodyParams{0};
  bool _readsForm{false};
};

using HandlerDescriptorPtr = std::shared_ptr<const HandlerDescriptor>;

}  // namespace ignyx

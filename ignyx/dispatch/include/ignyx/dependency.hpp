#pragma once

#include <any>
#include <cstdint>
#include <functional>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/flat-hash-map.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

class BackgroundTasks;
class HttpRequest;
class RequestContext;

enum class CachePolicy : uint8_t {
  // At most one invocation per request, the value is shared by every consumer.
  PerRequest,
  // Invoked again for every consumer.
  AlwaysRecompute
};

// View given to a dependency provider: its resolved sub-dependencies, the request and teardown registration.
class DependencyScope {
 public:
  DependencyScope(RequestContext& context, std::string_view name,
                  std::span<const std::pair<std::string_view, std::any*>> subValues) noexcept
      : _context(context), _name(name), _subValues(subValues) {}

  // Value of a declared sub-dependency. Throws std::invalid_argument if 'subName' is not one of them and
  // std::bad_any_cast if the stored value is not a T.
  template <class T>
  T& get(std::string_view subName) {
    return std::any_cast<T&>(value(subName));
  }

  std::any& value(std::string_view subName);

  [[nodiscard]] HttpRequest& request() noexcept;

  [[nodiscard]] BackgroundTasks& backgroundTasks() noexcept;

  // Registers 'fn' to run after the response is sent (or the request failed). Teardowns run in reverse
  // registration order, exactly once.
  void onTeardown(std::function<void()> fn);

  [[nodiscard]] std::string_view name() const noexcept { return _name; }

 private:
  RequestContext& _context;
  std::string_view _name;
  std::span<const std::pair<std::string_view, std::any*>> _subValues;
};

using DependencyProvider = std::function<std::any(DependencyScope&)>;

struct DependencyNode {
  std::string name;
  vector<std::string> subDependencies;
  DependencyProvider provider;
  CachePolicy cachePolicy{CachePolicy::PerRequest};
};

// Named dependency graph. Nodes may reference sub-dependencies declared later, but a declaration closing a cycle
// is rejected with CyclicDependency. Overrides replace a provider without changing the graph and may be changed
// at any time (tests).
class DependencyRegistry {
 public:
  DependencyRegistry() = default;

  DependencyRegistry(const DependencyRegistry&) = delete;
  DependencyRegistry& operator=(const DependencyRegistry&) = delete;

  // Throws std::invalid_argument if 'name' is already declared, CyclicDependency if the graph becomes cyclic.
  void declare(std::string name, vector<std::string> subDependencies, DependencyProvider provider,
               CachePolicy cachePolicy = CachePolicy::PerRequest);

  // Throws std::invalid_argument if 'name' is not declared.
  void override(std::string_view name, DependencyProvider provider);

  void clearOverride(std::string_view name);

  void clearOverrides();

  [[nodiscard]] bool contains(std::string_view name) const;

  // Throws std::invalid_argument if 'name' is not declared.
  [[nodiscard]] const DependencyNode& node(std::string_view name) const;

  // Override if any, declared provider otherwise.
  [[nodiscard]] DependencyProvider provider(const DependencyNode& node) const;

  // Resolution order of 'roots' and of their transitive sub-dependencies: every node comes after its
  // sub-dependencies. Throws std::invalid_argument for an undeclared name, CyclicDependency on a cycle.
  [[nodiscard]] vector<std::string> plan(std::span<const std::string> roots) const;

  // Checks that every referenced sub-dependency is declared.
  void validate() const;

  [[nodiscard]] std::size_t size() const noexcept { return _nodes.size(); }

 private:
  enum class Color : uint8_t { White, Grey, Black };

  using ColorMap = flat_hash_map<std::string, Color>;

  // Depth first search appending nodes in post order. 'path' holds the current chain for cycle reporting.
  // When 'allowUnknown' is set, undeclared sub-dependencies are skipped instead of reported.
  void visit(const std::string& name, ColorMap& colors, vector<std::string>& path, vector<std::string>& order,
             bool allowUnknown) const;

  flat_hash_map<std::string, DependencyNode> _nodes;
  mutable std::mutex _overridesMutex;
  flat_hash_map<std::string, DependencyProvider> _overrides;
};

}  // namespace ignyx

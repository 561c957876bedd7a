#include "ignyx/request-context.hpp"

#include <any>
#include <cstdint>
#include <exception>
#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>

#include "ignyx/call-lock.hpp"
#include "ignyx/demangle.hpp"
#include "ignyx/dependency.hpp"
#include "ignyx/log.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

namespace {

// Registration rejects cycles, so this only guards against overrides recursing through the registry.
constexpr uint32_t kMaxDependencyDepth = 64;

}  // namespace

RequestContext::~RequestContext() {
  if (_teardowns.empty()) {
    return;
  }
  if (_callLock == nullptr) {
    runTeardowns();
    return;
  }
  _callLock->lock();
  CallLock::Guard guard(*_callLock);
  runTeardowns();
}

std::any& RequestContext::resolveDependency(const DependencyRegistry& registry, std::string_view name) {
  return resolve(registry, registry.node(name), 0);
}

std::any* RequestContext::cachedDependency(std::string_view name) noexcept {
  auto it = _dependencyCache.find(std::string(name));
  return it == _dependencyCache.end() ? nullptr : it->second.get();
}

std::any& RequestContext::resolve(const DependencyRegistry& registry, const DependencyNode& node, uint32_t depth) {
  if (depth > kMaxDependencyDepth) {
    throw std::logic_error(std::format("Dependency chain too deep while resolving '{}'", node.name));
  }
  if (node.cachePolicy == CachePolicy::PerRequest) {
    if (std::any* cached = cachedDependency(node.name)) {
      return *cached;
    }
  }

  SmallVector<std::pair<std::string_view, std::any*>, 4> subValues;
  for (const std::string& subName : node.subDependencies) {
    std::any& subValue = resolve(registry, registry.node(subName), depth + 1);
    subValues.emplace_back(subName, &subValue);
  }

  DependencyScope scope(*this, node.name, {subValues.data(), subValues.size()});
  auto value = std::make_unique<std::any>(registry.provider(node)(scope));
  std::any& ref = *value;
  if (node.cachePolicy == CachePolicy::PerRequest) {
    _dependencyCache[node.name] = std::move(value);
  } else {
    auto& latest = _dependencyCache[node.name];
    if (latest) {
      _recomputedValues.push_back(std::move(latest));
    }
    latest = std::move(value);
  }
  return ref;
}

void RequestContext::runTeardowns() noexcept {
  while (!_teardowns.empty()) {
    std::function<void()> teardown = std::move(_teardowns.back());
    _teardowns.pop_back();
    try {
      teardown();
    } catch (const std::exception& ex) {
      log::error("Dependency teardown failed with {}: {}", DemangledName(typeid(ex)), ex.what());
    } catch (...) {
      log::error("Dependency teardown failed with a non standard exception");
    }
  }
}

}  // namespace ignyx

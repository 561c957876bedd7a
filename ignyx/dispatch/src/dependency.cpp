#include "ignyx/dependency.hpp"

#include <algorithm>
#include <any>
#include <format>
#include <functional>
#include <mutex>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/background-tasks.hpp"
#include "ignyx/errors.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/request-context.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

std::any& DependencyScope::value(std::string_view subName) {
  for (const auto& [name, valuePtr] : _subValues) {
    if (name == subName) {
      return *valuePtr;
    }
  }
  throw std::invalid_argument(
      std::format("'{}' is not a declared sub-dependency of dependency '{}'", subName, _name));
}

HttpRequest& DependencyScope::request() noexcept { return _context.request(); }

BackgroundTasks& DependencyScope::backgroundTasks() noexcept { return _context.backgroundTasks(); }

void DependencyScope::onTeardown(std::function<void()> fn) { _context.addTeardown(std::move(fn)); }

void DependencyRegistry::declare(std::string name, vector<std::string> subDependencies, DependencyProvider provider,
                                 CachePolicy cachePolicy) {
  if (name.empty()) {
    throw std::invalid_argument("Dependency name cannot be empty");
  }
  if (!provider) {
    throw std::invalid_argument(std::format("Dependency '{}' has no provider", name));
  }
  if (_nodes.find(name) != _nodes.end()) {
    throw std::invalid_argument(std::format("Dependency '{}' is already declared", name));
  }
  const std::string key = name;
  _nodes.emplace(key, DependencyNode{std::move(name), std::move(subDependencies), std::move(provider), cachePolicy});

  ColorMap colors;
  vector<std::string> path;
  vector<std::string> order;
  try {
    visit(key, colors, path, order, true);
  } catch (const CyclicDependency&) {
    _nodes.erase(key);
    throw;
  }
}

void DependencyRegistry::override(std::string_view name, DependencyProvider provider) {
  if (!contains(name)) {
    throw std::invalid_argument(std::format("Cannot override undeclared dependency '{}'", name));
  }
  std::scoped_lock lock(_overridesMutex);
  _overrides[std::string(name)] = std::move(provider);
}

void DependencyRegistry::clearOverride(std::string_view name) {
  std::scoped_lock lock(_overridesMutex);
  _overrides.erase(std::string(name));
}

void DependencyRegistry::clearOverrides() {
  std::scoped_lock lock(_overridesMutex);
  _overrides.clear();
}

bool DependencyRegistry::contains(std::string_view name) const { return _nodes.find(std::string(name)) != _nodes.end(); }

const DependencyNode& DependencyRegistry::node(std::string_view name) const {
  auto it = _nodes.find(std::string(name));
  if (it == _nodes.end()) {
    throw std::invalid_argument(std::format("Unknown dependency '{}'", name));
  }
  return it->second;
}

DependencyProvider DependencyRegistry::provider(const DependencyNode& node) const {
  std::scoped_lock lock(_overridesMutex);
  auto it = _overrides.find(node.name);
  if (it != _overrides.end()) {
    return it->second;
  }
  return node.provider;
}

vector<std::string> DependencyRegistry::plan(std::span<const std::string> roots) const {
  ColorMap colors;
  vector<std::string> path;
  vector<std::string> order;
  for (const std::string& root : roots) {
    visit(root, colors, path, order, false);
  }
  return order;
}

void DependencyRegistry::validate() const {
  vector<std::string> names;
  names.reserve(_nodes.size());
  for (const auto& [name, node] : _nodes) {
    names.push_back(name);
  }
  std::ranges::sort(names);
  [[maybe_unused]] const auto order = plan(std::span<const std::string>(names.data(), names.size()));
}

void DependencyRegistry::visit(const std::string& name, ColorMap& colors, vector<std::string>& path,
                               vector<std::string>& order, bool allowUnknown) const {
  auto nodeIt = _nodes.find(name);
  if (nodeIt == _nodes.end()) {
    if (allowUnknown) {
      return;
    }
    if (path.empty()) {
      throw std::invalid_argument(std::format("Unknown dependency '{}'", name));
    }
    throw std::invalid_argument(std::format("Unknown dependency '{}' required by '{}'", name, path.back()));
  }
  Color& color = colors[name];
  if (color == Color::Black) {
    return;
  }
  if (color == Color::Grey) {
    auto cycleStart = std::ranges::find(path, name);
    vector<std::string> cycle(cycleStart, path.end());
    cycle.push_back(name);
    throw CyclicDependency(std::move(cycle));
  }
  color = Color::Grey;
  path.push_back(name);
  for (const std::string& subName : nodeIt->second.subDependencies) {
    visit(subName, colors, path, order, allowUnknown);
  }
  path.pop_back();
  // 'color' may have been invalidated by insertions in 'colors' during the recursion.
  colors[name] = Color::Black;
  order.push_back(name);
}

}  // namespace ignyx

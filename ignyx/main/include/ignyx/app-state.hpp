#pragma once

#include <any>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/flat-hash-map.hpp"

namespace ignyx {

// Application wide values shared by handlers and lifecycle hooks (database pools, caches, settings...).
// Stored values have stable addresses until erased.
class AppState {
 public:
  AppState() = default;

  AppState(const AppState&) = delete;
  AppState& operator=(const AppState&) = delete;

  // Stores (or replaces) the value of 'key' and returns a reference to it.
  template <class T>
  T& set(std::string key, T value) {
    auto holder = std::make_unique<std::any>(std::move(value));
    std::any* stored = holder.get();
    std::lock_guard lock(_mutex);
    _values[std::move(key)] = std::move(holder);
    return std::any_cast<T&>(*stored);
  }

  // Throws std::out_of_range if 'key' is absent, std::bad_any_cast if it does not hold a T.
  template <class T>
  T& get(std::string_view key) {
    return std::any_cast<T&>(value(key));
  }

  template <class T>
  T* find(std::string_view key) {
    std::lock_guard lock(_mutex);
    auto it = _values.find(std::string(key));
    return it == _values.end() ? nullptr : std::any_cast<T>(it->second.get());
  }

  [[nodiscard]] bool contains(std::string_view key) const {
    std::lock_guard lock(_mutex);
    return _values.find(std::string(key)) != _values.end();
  }

  // Returns true if 'key' was present.
  bool erase(std::string_view key) {
    std::lock_guard lock(_mutex);
    return _values.erase(std::string(key)) != 0;
  }

 private:
  std::any& value(std::string_view key) {
    std::lock_guard lock(_mutex);
    auto it = _values.find(std::string(key));
    if (it == _values.end()) {
      throw std::out_of_range("No application state named '" + std::string(key) + "'");
    }
    return *it->second;
  }

  mutable std::mutex _mutex;
  flat_hash_map<std::string, std::unique_ptr<std::any>> _values;
};

}  // namespace ignyx

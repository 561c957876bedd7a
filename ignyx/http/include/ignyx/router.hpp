#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/flat-hash-map.hpp"
#include "ignyx/http-method.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/path-template.hpp"
#include "ignyx/router-config.hpp"
#include "ignyx/url-decode.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

// Registration of a template that is indistinguishable from an already registered one for the same method.
class RouteConflict : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

// Segment trie mapping (method, path) to a 'Target'.
// At each depth a literal child is tried first, then the named parameter child, then the catch-all, with
// backtracking, so that the result does not depend on registration order. The tree is only mutated by add()
// and clear(): match() is const and safe to call concurrently once registration is over.
// Paths are matched as received: segments are split on literal '/' and percent-decoded afterwards, so that an
// encoded "%2F" stays inside its segment.
template <class Target>
class Router {
 public:
  struct Match {
    enum class Kind : uint8_t { Matched, NotFound, MethodNotAllowed, Redirect };

    Kind kind{Kind::NotFound};
    const Target* target{nullptr};
    // Template of the matched route.
    std::string_view pattern;
    // Captured parameters, in template order.
    vector<PathParam> pathParams;
    // Methods accepted by the path (meaningful for MethodNotAllowed).
    http::MethodBmp allowedMethods{0};
    // Location for Redirect.
    std::string redirectPath;
  };

  explicit Router(RouterConfig config = {}) : _config(config) {}

  // Throws std::invalid_argument on a malformed template, RouteConflict if 'method' is already registered for a
  // template of the same shape (for instance "/users/{id}" and "/users/{name}").
  void add(http::Method method, std::string_view pattern, Target target) {
    PathTemplate compiled = PathTemplate::Compile(pattern);
    Node* node = _root.get();
    Endpoints* slot = nullptr;
    for (const PathTemplate::Segment& segment : compiled.segments) {
      switch (segment.kind) {
        case PathTemplate::SegmentKind::Literal: {
          auto& child = node->literalChildren[segment.text];
          if (!child) {
            child = std::make_unique<Node>();
          }
          node = child.get();
          break;
        }
        case PathTemplate::SegmentKind::Param:
          if (!node->paramChild) {
            node->paramChild = std::make_unique<Node>();
          }
          node = node->paramChild.get();
          break;
        default:
          slot = &node->catchAllEndpoints;
          break;
      }
    }
    if (slot == nullptr) {
      slot = compiled.trailingSlash ? &node->slashEndpoints : &node->endpoints;
    }
    auto& entry = (*slot)[http::MethodToIdx(method)];
    if (entry) {
      throw RouteConflict(std::format("Route {} {} conflicts with already registered {}", http::MethodToStr(method),
                                      pattern, entry->pattern));
    }
    entry.emplace(Endpoint{std::move(target), compiled.paramNames(), std::move(compiled.pattern)});
    ++_nbRoutes;
  }

  [[nodiscard]] Match match(http::Method method, std::string_view path) const {
    Match result = matchExact(method, path);
    if (result.kind != Match::Kind::NotFound ||
        _config.trailingSlashPolicy == RouterConfig::TrailingSlashPolicy::Strict || path.size() <= 1) {
      return result;
    }
    const bool hasTrailingSlash = path.back() == '/';
    std::string alternate(hasTrailingSlash ? path.substr(0, path.size() - 1) : path);
    if (!hasTrailingSlash) {
      alternate.push_back('/');
    }
    Match alternateResult = matchExact(method, alternate);
    if (alternateResult.kind == Match::Kind::NotFound) {
      return result;
    }
    if (_config.trailingSlashPolicy == RouterConfig::TrailingSlashPolicy::Normalize) {
      return alternateResult;
    }
    if (hasTrailingSlash) {
      Match redirect;
      redirect.kind = Match::Kind::Redirect;
      redirect.redirectPath = std::move(alternate);
      return redirect;
    }
    return result;
  }

  // Removes all routes, as if newly constructed with the same configuration.
  void clear() {
    _root = std::make_unique<Node>();
    _nbRoutes = 0;
  }

  [[nodiscard]] std::size_t size() const noexcept { return _nbRoutes; }

  [[nodiscard]] const RouterConfig& config() const noexcept { return _config; }

 private:
  struct Endpoint {
    Target target;
    vector<std::string> paramNames;
    std::string pattern;
  };

  using Endpoints = std::array<std::optional<Endpoint>, http::kNbMethods>;

  struct Node {
    flat_hash_map<std::string, std::unique_ptr<Node>> literalChildren;
    std::unique_ptr<Node> paramChild;
    // Path ends on this node.
    Endpoints endpoints;
    // Path ends on this node followed by a '/'.
    Endpoints slashEndpoints;
    // "{name:path}" capturing everything after this node.
    Endpoints catchAllEndpoints;
  };

  struct SearchState {
    http::Method method;
    std::string_view path;
    vector<std::string_view> captures;
    const Endpoint* found{nullptr};
    http::MethodBmp allowed{0};
  };

  static http::MethodBmp EndpointMethods(const Endpoints& endpoints) {
    http::MethodBmp methods = 0;
    for (http::MethodIdx idx = 0; idx < http::kNbMethods; ++idx) {
      if (endpoints[idx]) {
        methods = methods | http::MethodFromIdx(idx);
      }
    }
    if (http::IsMethodSet(methods, http::Method::GET)) {
      methods = methods | http::Method::HEAD;
    }
    return methods;
  }

  // Records the methods of 'endpoints' and returns true if one accepts the searched method.
  static bool Consider(const Endpoints& endpoints, SearchState& state) {
    const http::MethodBmp methods = EndpointMethods(endpoints);
    if (methods == 0) {
      return false;
    }
    state.allowed = static_cast<http::MethodBmp>(state.allowed | methods);
    const auto& exact = endpoints[http::MethodToIdx(state.method)];
    if (exact) {
      state.found = &*exact;
      return true;
    }
    const auto& get = endpoints[http::MethodToIdx(http::Method::GET)];
    if (state.method == http::Method::HEAD && get) {
      state.found = &*get;
      return true;
    }
    return false;
  }

  static std::string DecodeSegment(std::string_view segment) {
    return segment.find('%') == std::string_view::npos ? std::string(segment) : url::DecodeLenient(segment);
  }

  // 'pos' is the index following a '/' in the searched path.
  static bool Search(const Node& node, std::size_t pos, SearchState& state) {
    const std::string_view path = state.path;
    if (pos == path.size()) {
      if (Consider(node.slashEndpoints, state)) {
        return true;
      }
      state.captures.push_back(path.substr(pos));
      if (Consider(node.catchAllEndpoints, state)) {
        return true;
      }
      state.captures.pop_back();
      return false;
    }

    const std::size_t end = std::min(path.find('/', pos), path.size());
    const std::string_view segment = path.substr(pos, end - pos);
    auto visitChild = [&state, end, path](const Node& child) {
      return end == path.size() ? Consider(child.endpoints, state) : Search(child, end + 1, state);
    };

    if (auto it = node.literalChildren.find(DecodeSegment(segment)); it != node.literalChildren.end()) {
      if (visitChild(*it->second)) {
        return true;
      }
    }
    if (node.paramChild && !segment.empty()) {
      state.captures.push_back(segment);
      if (visitChild(*node.paramChild)) {
        return true;
      }
      state.captures.pop_back();
    }
    state.captures.push_back(path.substr(pos));
    if (Consider(node.catchAllEndpoints, state)) {
      return true;
    }
    state.captures.pop_back();
    return false;
  }

  Match matchExact(http::Method method, std::string_view path) const {
    Match result;
    if (path.empty() || path.front() != '/') {
      return result;
    }
    SearchState state{method, path, {}, nullptr, 0};
    if (Search(*_root, 1, state)) {
      result.kind = Match::Kind::Matched;
      result.target = &state.found->target;
      result.pattern = state.found->pattern;
      result.allowedMethods = state.allowed;
      for (std::size_t idx = 0; idx < state.captures.size(); ++idx) {
        result.pathParams.push_back(PathParam{state.found->paramNames[idx], DecodeSegment(state.captures[idx])});
      }
    } else if (state.allowed != 0) {
      result.kind = Match::Kind::MethodNotAllowed;
      result.allowedMethods = state.allowed;
    }
    return result;
  }

  RouterConfig _config;
  std::unique_ptr<Node> _root = std::make_unique<Node>();
  std::size_t _nbRoutes{0};
};

}  // namespace ignyx

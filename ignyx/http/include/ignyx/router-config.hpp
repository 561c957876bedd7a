#pragma once

#include <cstdint>

namespace ignyx {

struct RouterConfig {
  enum class TrailingSlashPolicy : std::int8_t { Strict, Normalize, Redirect };

  // How to resolve a request path that only differs from a registered one by a trailing slash.
  // An exact match is always tried first, the policy only applies when it fails:
  //   Strict   : no transformation, 404.
  //   Normalize: dispatch to the registered variant (both directions).
  //   Redirect : answer 307 towards the registered variant without the trailing slash.
  // The root path "/" is never transformed.
  TrailingSlashPolicy trailingSlashPolicy{TrailingSlashPolicy::Normalize};

  RouterConfig& withTrailingSlashPolicy(TrailingSlashPolicy policy) {
    trailingSlashPolicy = policy;
    return *this;
  }
};

}  // namespace ignyx

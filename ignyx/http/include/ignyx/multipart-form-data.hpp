#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>

#include "ignyx/vector.hpp"

namespace ignyx {

struct MultipartFormDataOptions {
  std::size_t maxParts{128};
  std::size_t maxPartSizeBytes{32UL * 1024UL * 1024UL};
};

// multipart/form-data body parser. Parts reference the body given at construction, which must outlive
// this object. Malformed input does not throw: valid() becomes false and invalidReason() tells why.
class MultipartFormData {
 public:
  struct Part {
    std::string_view name;
    std::optional<std::string_view> filename;
    std::optional<std::string_view> contentType;
    std::string_view value;
  };

  MultipartFormData() noexcept = default;

  MultipartFormData(std::string_view contentTypeHeader, std::string_view body, MultipartFormDataOptions options = {});

  [[nodiscard]] std::span<const Part> parts() const noexcept { return {_parts.data(), _parts.size()}; }

  // First part named 'name', or nullptr.
  [[nodiscard]] const Part* part(std::string_view name) const noexcept;

  [[nodiscard]] bool valid() const noexcept { return _invalidReason.empty(); }

  [[nodiscard]] std::string_view invalidReason() const noexcept { return _invalidReason; }

  // Extracts the boundary parameter of a multipart/form-data content type, or an empty view.
  static std::string_view Boundary(std::string_view contentTypeHeader) noexcept;

 private:
  vector<Part> _parts;
  std::string_view _invalidReason;
};

}  // namespace ignyx

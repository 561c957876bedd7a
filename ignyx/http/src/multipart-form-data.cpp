#include "ignyx/multipart-form-data.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "ignyx/http-constants.hpp"
#include "ignyx/string-equal-ignore-case.hpp"
#include "ignyx/string-trim.hpp"

namespace ignyx {

namespace {

std::string_view StripQuotes(std::string_view value) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value.remove_prefix(1);
    value.remove_suffix(1);
  }
  return value;
}

// Iterates over the ';' separated 'key=value' parameters following the first token of a header value.
template <class Callback>
void ForEachParameter(std::string_view headerValue, Callback callback) {
  auto semicolon = headerValue.find(';');
  while (semicolon != std::string_view::npos) {
    headerValue.remove_prefix(semicolon + 1);
    semicolon = headerValue.find(';');
    const std::string_view param = Trim(headerValue.substr(0, semicolon), kOws);
    const auto eq = param.find('=');
    if (eq != std::string_view::npos) {
      callback(Trim(param.substr(0, eq), kOws), StripQuotes(Trim(param.substr(eq + 1), kOws)));
    }
  }
}

// Fills name / filename of 'part'. Returns a non-empty reason on failure.
std::string_view ParseContentDisposition(std::string_view value, MultipartFormData::Part& part) {
  const std::string_view type = Trim(value.substr(0, value.find(';')), kOws);
  if (!CaseInsensitiveEqual(type, "form-data")) {
    return "multipart part must have Content-Disposition: form-data";
  }
  ForEachParameter(value, [&part](std::string_view key, std::string_view paramValue) {
    if (CaseInsensitiveEqual(key, "name")) {
      part.name = paramValue;
    } else if (CaseInsensitiveEqual(key, "filename")) {
      part.filename = paramValue;
    }
  });
  if (part.name.empty()) {
    return "multipart part missing name parameter";
  }
  return {};
}

}  // namespace

std::string_view MultipartFormData::Boundary(std::string_view contentTypeHeader) noexcept {
  const std::string_view mediaType = Trim(contentTypeHeader.substr(0, contentTypeHeader.find(';')), kOws);
  if (!CaseInsensitiveEqual(mediaType, http::ContentTypeMultipartFormData)) {
    return {};
  }
  std::string_view boundary;
  ForEachParameter(contentTypeHeader, [&boundary](std::string_view key, std::string_view value) {
    if (CaseInsensitiveEqual(key, "boundary")) {
      boundary = value;
    }
  });
  return boundary;
}

MultipartFormData::MultipartFormData(std::string_view contentTypeHeader, std::string_view body,
                                     MultipartFormDataOptions options) {
  const std::string_view boundary = Boundary(contentTypeHeader);
  if (boundary.empty()) {
    _invalidReason = "missing multipart boundary";
    return;
  }
  const std::string delimiter = std::string("--").append(boundary);

  auto pos = body.find(delimiter);
  if (pos == std::string_view::npos) {
    _invalidReason = "multipart body does not contain the boundary";
    return;
  }
  pos += delimiter.size();
  while (true) {
    if (body.substr(pos, 2) == "--") {
      return;  // closing delimiter
    }
    if (body.substr(pos, http::CRLF.size()) != http::CRLF) {
      _invalidReason = "multipart boundary not followed by CRLF";
      return;
    }
    pos += http::CRLF.size();

    const auto headEnd = body.find(http::DoubleCRLF, pos);
    if (headEnd == std::string_view::npos) {
      _invalidReason = "multipart part headers are not terminated";
      return;
    }
    Part part;
    std::string_view headers = body.substr(pos, headEnd - pos);
    while (!headers.empty()) {
      const auto lineEnd = headers.find(http::CRLF);
      const std::string_view line = headers.substr(0, lineEnd);
      headers = lineEnd == std::string_view::npos ? std::string_view{} : headers.substr(lineEnd + 2);
      const auto colon = line.find(':');
      if (colon == std::string_view::npos) {
        _invalidReason = "multipart part header missing colon";
        return;
      }
      const std::string_view name = Trim(line.substr(0, colon), kOws);
      const std::string_view value = Trim(line.substr(colon + 1), kOws);
      if (CaseInsensitiveEqual(name, "Content-Disposition")) {
        _invalidReason = ParseContentDisposition(value, part);
        if (!_invalidReason.empty()) {
          return;
        }
      } else if (CaseInsensitiveEqual(name, http::ContentType)) {
        part.contentType = value;
      }
    }
    if (part.name.empty()) {
      _invalidReason = "multipart part missing Content-Disposition";
      return;
    }

    const auto valueStart = headEnd + http::DoubleCRLF.size();
    const auto next = body.find(std::string("\r\n").append(delimiter), valueStart);
    if (next == std::string_view::npos) {
      _invalidReason = "multipart part is not terminated by the boundary";
      return;
    }
    part.value = body.substr(valueStart, next - valueStart);
    if (part.value.size() > options.maxPartSizeBytes) {
      _invalidReason = "multipart part exceeds size limit";
      return;
    }
    if (_parts.size() == options.maxParts) {
      _invalidReason = "multipart body exceeds part limit";
      return;
    }
    _parts.push_back(part);
    pos = next + http::CRLF.size() + delimiter.size();
  }
}

const MultipartFormData::Part* MultipartFormData::part(std::string_view name) const noexcept {
  for (const Part& part : _parts) {
    if (part.name == name) {
      return &part;
    }
  }
  return nullptr;
}

}  // namespace ignyx

#include "ignyx/http-request-parser.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "ignyx/http-constants.hpp"
#include "ignyx/http-method.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/string-equal-ignore-case.hpp"
#include "ignyx/string-trim.hpp"

namespace ignyx {

namespace {

constexpr ParseOutcome Error(http::StatusCode status) {
  return ParseOutcome{ParseOutcome::Status::Error, status, 0, false, false};
}

constexpr bool IsTokenChar(char ch) {
  constexpr std::string_view kSpecials = "!#$%&'*+-.^_`|~";
  return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
         kSpecials.find(ch) != std::string_view::npos;
}

enum class ChunkedStatus : uint8_t { Complete, NeedMore, Invalid, TooLarge };

// Decodes a chunked body starting at 'data'. On Complete, 'consumed' holds the size of the encoded body.
ChunkedStatus DecodeChunked(std::string_view data, std::size_t maxBodyBytes, std::string& body, std::size_t& consumed) {
  std::size_t pos = 0;
  while (true) {
    const auto lineEnd = data.find(http::CRLF, pos);
    if (lineEnd == std::string_view::npos) {
      return ChunkedStatus::NeedMore;
    }
    std::string_view sizeLine = data.substr(pos, lineEnd - pos);
    sizeLine = Trim(sizeLine.substr(0, sizeLine.find(';')), kOws);
    std::size_t chunkSize = 0;
    const auto [ptr, ec] = std::from_chars(sizeLine.data(), sizeLine.data() + sizeLine.size(), chunkSize, 16);
    if (ec != std::errc{} || ptr != sizeLine.data() + sizeLine.size() || sizeLine.empty()) {
      return ChunkedStatus::Invalid;
    }
    pos = lineEnd + http::CRLF.size();
    if (chunkSize == 0) {
      // Trailer section, ignored, terminated by an empty line.
      while (true) {
        const auto trailerEnd = data.find(http::CRLF, pos);
        if (trailerEnd == std::string_view::npos) {
          return ChunkedStatus::NeedMore;
        }
        const bool emptyLine = trailerEnd == pos;
        pos = trailerEnd + http::CRLF.size();
        if (emptyLine) {
          consumed = pos;
          return ChunkedStatus::Complete;
        }
      }
    }
    if (body.size() + chunkSize > maxBodyBytes) {
      return ChunkedStatus::TooLarge;
    }
    if (data.size() < pos + chunkSize + http::CRLF.size()) {
      return ChunkedStatus::NeedMore;
    }
    body.append(data.substr(pos, chunkSize));
    pos += chunkSize;
    if (data.substr(pos, http::CRLF.size()) != http::CRLF) {
      return ChunkedStatus::Invalid;
    }
    pos += http::CRLF.size();
  }
}

}  // namespace

ParseOutcome HttpRequestParser::parse(std::string_view data, HttpRequest& out) const {
  const auto headEnd = data.find(http::DoubleCRLF);
  if (headEnd == std::string_view::npos) {
    if (data.size() > _limits.maxHeaderBytes) {
      return Error(http::StatusCodeRequestHeaderFieldsTooLarge);
    }
    return ParseOutcome{};
  }
  if (headEnd > _limits.maxHeaderBytes) {
    return Error(http::StatusCodeRequestHeaderFieldsTooLarge);
  }

  std::string_view head = data.substr(0, headEnd);
  const auto requestLineEnd = head.find(http::CRLF);
  const std::string_view requestLine = head.substr(0, requestLineEnd);
  head = requestLineEnd == std::string_view::npos ? std::string_view{} : head.substr(requestLineEnd + 2);

  // Request line: METHOD SP request-target SP HTTP-version
  const auto firstSp = requestLine.find(' ');
  const auto lastSp = requestLine.rfind(' ');
  if (firstSp == std::string_view::npos || lastSp == firstSp) {
    return Error(http::StatusCodeBadRequest);
  }
  const auto method = http::MethodStrToOpt(requestLine.substr(0, firstSp));
  if (!method) {
    return Error(http::StatusCodeNotImplemented);
  }
  const std::string_view target = requestLine.substr(firstSp + 1, lastSp - firstSp - 1);
  const std::string_view version = requestLine.substr(lastSp + 1);
  if (version != http::HTTP11Sv && version != http::HTTP10Sv) {
    return Error(http::StatusCodeHTTPVersionNotSupported);
  }
  if (target.empty() || target.front() != '/') {
    return Error(http::StatusCodeBadRequest);
  }

  HttpRequest request;
  request._method = *method;
  request._version.assign(version);

  while (!head.empty()) {
    const auto lineEnd = head.find(http::CRLF);
    const std::string_view line = head.substr(0, lineEnd);
    head = lineEnd == std::string_view::npos ? std::string_view{} : head.substr(lineEnd + 2);

    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos || colonPos == 0) {
      return Error(http::StatusCodeBadRequest);
    }
    const std::string_view name = line.substr(0, colonPos);
    for (char ch : name) {
      if (!IsTokenChar(ch)) {
        return Error(http::StatusCodeBadRequest);
      }
    }
    request._headers.append(name, Trim(line.substr(colonPos + 1), kOws));
  }

  if (!request.setTarget(target)) {
    return Error(http::StatusCodeBadRequest);
  }
  request.parseCookies();

  const std::size_t bodyStart = headEnd + http::DoubleCRLF.size();
  const std::string_view rest = data.substr(bodyStart);
  const auto transferEncoding = request._headers.get(http::TransferEncoding);
  const auto contentLength = request._headers.get(http::ContentLength);
  const bool expectContinue = CaseInsensitiveEqual(request._headers.getOrEmpty(http::Expect), http::h100_continue);

  std::size_t bodyConsumed = 0;
  if (transferEncoding) {
    if (contentLength || !CaseInsensitiveEqual(Trim(*transferEncoding, kOws), http::chunked)) {
      return Error(http::StatusCodeBadRequest);
    }
    switch (DecodeChunked(rest, _limits.maxBodyBytes, request._body, bodyConsumed)) {
      case ChunkedStatus::NeedMore:
        return ParseOutcome{ParseOutcome::Status::NeedMore, 0, 0, true, expectContinue};
      case ChunkedStatus::Invalid:
        return Error(http::StatusCodeBadRequest);
      case ChunkedStatus::TooLarge:
        return Error(http::StatusCodePayloadTooLarge);
      default:
        break;
    }
  } else if (contentLength) {
    std::size_t length = 0;
    const auto [ptr, ec] = std::from_chars(contentLength->data(), contentLength->data() + contentLength->size(), length);
    if (ec != std::errc{} || ptr != contentLength->data() + contentLength->size()) {
      return Error(http::StatusCodeBadRequest);
    }
    if (length > _limits.maxBodyBytes) {
      return Error(http::StatusCodePayloadTooLarge);
    }
    if (rest.size() < length) {
      return ParseOutcome{ParseOutcome::Status::NeedMore, 0, 0, true, expectContinue};
    }
    request._body.assign(rest.substr(0, length));
    bodyConsumed = length;
  }

  out = std::move(request);
  return ParseOutcome{ParseOutcome::Status::Complete, 0, bodyStart + bodyConsumed, true, expectContinue};
}

}  // namespace ignyx

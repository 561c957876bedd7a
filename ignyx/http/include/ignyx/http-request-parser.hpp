#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "ignyx/http-request.hpp"
#include "ignyx/http-status-code.hpp"

namespace ignyx {

struct ParserLimits {
  std::size_t maxHeaderBytes{8UL * 1024UL};
  std::size_t maxBodyBytes{16UL * 1024UL * 1024UL};
};

struct ParseOutcome {
  enum class Status : uint8_t { NeedMore, Complete, Error };

  Status status{Status::NeedMore};
  // Set when status is Error: the status code to answer with before closing the connection.
  http::StatusCode errorStatus{0};
  // Number of bytes making up the request when status is Complete.
  std::size_t consumed{0};
  // The head is complete, only body bytes are missing.
  bool headComplete{false};
  // The client sent 'Expect: 100-continue' and waits for an interim response before sending its body.
  bool expectContinue{false};
};

// Stateless HTTP/1.x request parser. Each call attempts to extract one complete request from the front of
// the given buffer. Bodies are delimited by Content-Length or chunked transfer coding (which is decoded).
class HttpRequestParser {
 public:
  explicit HttpRequestParser(ParserLimits limits = {}) noexcept : _limits(limits) {}

  [[nodiscard]] ParseOutcome parse(std::string_view data, HttpRequest& out) const;

  [[nodiscard]] const ParserLimits& limits() const noexcept { return _limits; }

 private:
  ParserLimits _limits;
};

}  // namespace ignyx

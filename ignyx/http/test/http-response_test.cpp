#include "ignyx/http-response.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

#include "ignyx/cookie.hpp"
#include "ignyx/http-status-code.hpp"

namespace ignyx {

namespace {

bool Contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

}  // namespace

TEST(HttpResponse, SerializeFixedBody) {
  HttpResponse response = HttpResponse::PlainText("hello");
  response.header("X-Custom", "1");
  const std::string wire = response.serialize({false, true, "ignyx"});
  EXPECT_TRUE(wire.starts_with("HTTP/1.1 200 OK\r\n"));
  EXPECT_TRUE(Contains(wire, "\r\nDate: "));
  EXPECT_TRUE(Contains(wire, "\r\nServer: ignyx\r\n"));
  EXPECT_TRUE(Contains(wire, "\r\nContent-Type: text/plain; charset=utf-8\r\n"));
  EXPECT_TRUE(Contains(wire, "\r\nX-Custom: 1\r\n"));
  EXPECT_TRUE(Contains(wire, "\r\nContent-Length: 5\r\n"));
  EXPECT_TRUE(Contains(wire, "\r\nConnection: keep-alive\r\n"));
  EXPECT_TRUE(wire.ends_with("\r\n\r\nhello"));
}

TEST(HttpResponse, HeadRequestOmitsBodyButKeepsLength) {
  const std::string wire = HttpResponse::PlainText("hello").serialize({true, false, {}});
  EXPECT_TRUE(Contains(wire, "Content-Length: 5\r\n"));
  EXPECT_TRUE(Contains(wire, "Connection: close\r\n"));
  EXPECT_FALSE(Contains(wire, "Server:"));
  EXPECT_TRUE(wire.ends_with("\r\n\r\n"));
}

TEST(HttpResponse, ReservedHeadersAreComputed) {
  HttpResponse response(http::StatusCodeOK, "abc", "text/plain");
  response.header("Content-Length", "999").header("Connection", "upgrade");
  const std::string wire = response.serialize({false, true, {}});
  EXPECT_TRUE(Contains(wire, "Content-Length: 3\r\n"));
  EXPECT_FALSE(Contains(wire, "999"));
  EXPECT_FALSE(Contains(wire, "Connection: upgrade"));
}

TEST(HttpResponse, NoContentHasNoLength) {
  const std::string wire = HttpResponse(http::StatusCodeNoContent).serialize({false, true, {}});
  EXPECT_TRUE(wire.starts_with("HTTP/1.1 204 No Content\r\n"));
  EXPECT_FALSE(Contains(wire, "Content-Length"));
}

TEST(HttpResponse, CookiesAreSerializedOnePerHeader) {
  HttpResponse response;
  Cookie cookie;
  cookie.name = "a";
  cookie.value = "1";
  response.setCookie(cookie).deleteCookie("b");
  const std::string wire = response.serializeHead({false, true, {}});
  EXPECT_TRUE(Contains(wire, "Set-Cookie: a=1; Path=/; SameSite=Lax\r\n"));
  EXPECT_TRUE(Contains(wire, "Set-Cookie: b=; Max-Age=0;"));
}

TEST(HttpResponse, StreamingHeadAnnouncesChunkedCoding) {
  int remaining = 2;
  HttpResponse response;
  response.streamingBody(
      [&remaining]() -> std::optional<std::string> {
        if (remaining == 0) {
          return std::nullopt;
        }
        --remaining;
        return std::string("chunk");
      },
      "text/plain");
  ASSERT_TRUE(response.isStreaming());
  const std::string head = response.serializeHead({false, true, {}});
  EXPECT_TRUE(Contains(head, "Transfer-Encoding: chunked\r\n"));
  EXPECT_FALSE(Contains(head, "Content-Length"));

  auto source = response.takeChunkSource();
  EXPECT_EQ(source(), std::optional<std::string>("chunk"));
  EXPECT_EQ(source(), std::optional<std::string>("chunk"));
  EXPECT_EQ(source(), std::nullopt);
}

TEST(HttpResponse, EncodeChunk) {
  EXPECT_EQ(HttpResponse::EncodeChunk("hello world, this is 26 b!"), "1a\r\nhello world, this is 26 b!\r\n");
  EXPECT_EQ(HttpResponse::EncodeChunk({}), "0\r\n\r\n");
}

TEST(HttpResponse, RedirectAndFile) {
  const HttpResponse redirect = HttpResponse::Redirect("/login");
  EXPECT_EQ(redirect.status(), http::StatusCodeTemporaryRedirect);
  EXPECT_EQ(redirect.headerValue("Location"), "/login");

  const HttpResponse file = HttpResponse::File("data", "report.csv", "text/csv");
  EXPECT_EQ(file.headerValue("Content-Disposition"), "attachment; filename=\"report.csv\"");
  EXPECT_EQ(file.body(), "data");
}

}  // namespace ignyx

#include "ignyx/exception-handlers.hpp"

#include <gtest/gtest.h>

#include <exception>
#include <stdexcept>
#include <string>

#include "ignyx/errors.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/json.hpp"

namespace ignyx {

namespace {

class StorageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class DiskFull : public StorageError {
 public:
  DiskFull() : StorageError("disk full") {}
};

const HttpRequest& Request() {
  static const HttpRequest kRequest = HttpRequest::FromParts(http::Method::GET, "/files");
  return kRequest;
}

template <class E>
HttpResponse Handle(const ExceptionHandlers& handlers, E ex) {
  return handlers.handle(Request(), std::make_exception_ptr(std::move(ex)));
}

}  // namespace

TEST(ExceptionHandlers, DefaultRendering) {
  const ExceptionHandlers handlers;
  HttpResponse response = Handle(handlers, HttpException(http::StatusCodeForbidden, "nope"));
  EXPECT_EQ(response.status(), http::StatusCodeForbidden);
  EXPECT_EQ(response.body(), R"({"detail":"nope"})");

  response = Handle(handlers, MethodNotAllowed(http::Method::GET | http::Method::HEAD));
  EXPECT_EQ(response.status(), http::StatusCodeMethodNotAllowed);
  EXPECT_TRUE(response.headerValue("Allow"));

  response = Handle(handlers, LockTimeout("busy"));
  EXPECT_EQ(response.status(), http::StatusCodeServiceUnavailable);

  response = Handle(handlers, std::runtime_error("secret"));
  EXPECT_EQ(response.status(), http::StatusCodeInternalServerError);
  EXPECT_EQ(response.body(), R"({"detail":"Internal Server Error"})");
}

TEST(ExceptionHandlers, DebugRevealsNestedChain) {
  ExceptionHandlers handlers;
  handlers.setDebug(true);
  std::exception_ptr error;
  try {
    try {
      throw std::out_of_range("index 3");
    } catch (...) {
      std::throw_with_nested(std::runtime_error("lookup failed"));
    }
  } catch (...) {
    error = std::current_exception();
  }
  const HttpResponse response = handlers.handle(Request(), error);
  EXPECT_EQ(response.status(), http::StatusCodeInternalServerError);
  auto body = ParseJson(response.body());
  ASSERT_TRUE(body);
  EXPECT_EQ((*body)["detail"].get<std::string>(), "lookup failed");
  ASSERT_TRUE((*body)["traceback"].is_array());
  EXPECT_EQ((*body)["traceback"].get_array().size(), 2U);
}

TEST(ExceptionHandlers, ExactTypeWinsOverBaseClass) {
  ExceptionHandlers handlers;
  handlers.add<StorageError>([](const HttpRequest&, const StorageError&) {
    return HttpResponse::PlainText("storage", http::StatusCodeServiceUnavailable);
  });
  handlers.add<DiskFull>([](const HttpRequest&, const DiskFull&) {
    return HttpResponse::PlainText("disk", http::StatusCodeConflict);
  });
  EXPECT_EQ(Handle(handlers, DiskFull()).body(), "disk");
  EXPECT_EQ(Handle(handlers, StorageError("io")).body(), "storage");
}

TEST(ExceptionHandlers, BaseClassHandlerCatchesDerivedExceptions) {
  ExceptionHandlers handlers;
  handlers.add<StorageError>([](const HttpRequest& request, const StorageError& ex) {
    return HttpResponse::PlainText(std::string(request.path()) + ": " + ex.what(), http::StatusCodeBadGateway);
  });
  const HttpResponse response = Handle(handlers, DiskFull());
  EXPECT_EQ(response.status(), http::StatusCodeBadGateway);
  EXPECT_EQ(response.body(), "/files: disk full");
}

TEST(ExceptionHandlers, StatusHandlersComeAfterTypeHandlers) {
  ExceptionHandlers handlers;
  handlers.addStatus(http::StatusCodeNotFound, [](const HttpRequest&, const std::exception&) {
    return HttpResponse::Html("<p>missing</p>", http::StatusCodeNotFound);
  });
  EXPECT_EQ(Handle(handlers, RouteNotFound()).body(), "<p>missing</p>");

  handlers.add<RouteNotFound>([](const HttpRequest&, const RouteNotFound&) {
    return HttpResponse::PlainText("typed", http::StatusCodeNotFound);
  });
  EXPECT_EQ(Handle(handlers, RouteNotFound()).body(), "typed");
}

TEST(ExceptionHandlers, FailingUserHandlerFallsBackToDefaultRendering) {
  ExceptionHandlers handlers;
  handlers.add<StorageError>([](const HttpRequest&, const StorageError&) -> HttpResponse {
    throw HttpException(http::StatusCodeConflict, "handler failed");
  });
  const HttpResponse response = Handle(handlers, DiskFull());
  EXPECT_EQ(response.status(), http::StatusCodeConflict);
  EXPECT_EQ(response.body(), R"({"detail":"handler failed"})");
}

}  // namespace ignyx

#include "ignyx/cors-policy.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <initializer_list>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "ignyx/http-constants.hpp"
#include "ignyx/http-method.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/middleware.hpp"

namespace ignyx {

namespace {

HttpRequest Build(http::Method method,
                  std::initializer_list<std::pair<std::string_view, std::string_view>> headers) {
  return HttpRequest::FromParts(method, "/resource", headers);
}

}  // namespace

class CorsPolicyTest : public ::testing::Test {
 protected:
  CorsPolicy policy;
  HttpResponse response;
};

TEST_F(CorsPolicyTest, RequestWithoutOriginIsNotCors) {
  const HttpRequest request = Build(http::Method::GET, {});
  EXPECT_EQ(policy.applyToResponse(request, response), CorsPolicy::ApplyStatus::NotCors);
  EXPECT_EQ(policy.handlePreflight(request).status, CorsPolicy::PreflightResult::Status::NotPreflight);
  EXPECT_FALSE(response.headerValue(http::AccessControlAllowOrigin));
}

TEST_F(CorsPolicyTest, AnyOriginSimpleRequest) {
  const HttpRequest request = Build(http::Method::GET, {{"Origin", "https://example.com"}});
  EXPECT_EQ(policy.applyToResponse(request, response), CorsPolicy::ApplyStatus::Applied);
  EXPECT_EQ(response.headerValue(http::AccessControlAllowOrigin), "*");
  EXPECT_FALSE(response.headerValue(http::Vary));
}

TEST_F(CorsPolicyTest, AllowListMirrorsOriginAndAddsCredentials) {
  policy.allowOrigin("https://api.example").allowOrigin("\thttps://API.EXAMPLE  ").allowCredentials(true);
  response.addHeader(http::Vary, "Accept-Encoding");

  const HttpRequest request = Build(http::Method::GET, {{"Origin", "https://api.example"}});
  EXPECT_EQ(policy.applyToResponse(request, response), CorsPolicy::ApplyStatus::Applied);
  EXPECT_EQ(response.headerValue(http::AccessControlAllowOrigin), "https://api.example");
  EXPECT_EQ(response.headerValue(http::AccessControlAllowCredentials), "true");
  const auto vary = response.headers().getAll(http::Vary);
  ASSERT_EQ(vary.size(), 2U);
  EXPECT_EQ(vary[1], "Origin");

  HttpResponse denied;
  EXPECT_EQ(policy.applyToResponse(Build(http::Method::GET, {{"Origin", "https://evil.example"}}), denied),
            CorsPolicy::ApplyStatus::OriginDenied);
  EXPECT_FALSE(denied.headerValue(http::AccessControlAllowOrigin));
}

TEST_F(CorsPolicyTest, Preflight) {
  policy.allowOrigin("https://app.example")
      .allowMethods(http::Method::GET | http::Method::POST)
      .allowRequestHeader("X-Token")
      .exposeHeader("X-Trace")
      .maxAge(std::chrono::seconds{600});

  const auto allowed = policy.handlePreflight(Build(http::Method::OPTIONS, {{"Origin", "https://app.example"},
                                                                            {"Access-Control-Request-Method", "POST"},
                                                                            {"Access-Control-Request-Headers", "x-token"}}));
  EXPECT_EQ(allowed.status, CorsPolicy::PreflightResult::Status::Allowed);
  EXPECT_EQ(allowed.response.status(), http::StatusCodeOK);
  EXPECT_EQ(allowed.response.headerValue(http::AccessControlAllowMethods), "GET, POST");
  EXPECT_EQ(allowed.response.headerValue(http::AccessControlAllowHeaders), "X-Token");
  EXPECT_EQ(allowed.response.headerValue(http::AccessControlMaxAge), "600");
  EXPECT_EQ(allowed.response.headerValue(http::AccessControlExposeHeaders), "X-Trace");

  const auto badMethod = policy.handlePreflight(Build(
      http::Method::OPTIONS, {{"Origin", "https://app.example"}, {"Access-Control-Request-Method", "DELETE"}}));
  EXPECT_EQ(badMethod.status, CorsPolicy::PreflightResult::Status::MethodDenied);
  EXPECT_EQ(badMethod.response.status(), http::StatusCodeBadRequest);

  const auto badHeaders = policy.handlePreflight(Build(http::Method::OPTIONS, {{"Origin", "https://app.example"},
                                                                               {"Access-Control-Request-Method", "GET"},
                                                                               {"Access-Control-Request-Headers", "X-Other"}}));
  EXPECT_EQ(badHeaders.status, CorsPolicy::PreflightResult::Status::HeadersDenied);

  const auto badOrigin = policy.handlePreflight(
      Build(http::Method::OPTIONS, {{"Origin", "https://other.example"}, {"Access-Control-Request-Method", "GET"}}));
  EXPECT_EQ(badOrigin.status, CorsPolicy::PreflightResult::Status::OriginDenied);
}

TEST_F(CorsPolicyTest, NegativeMaxAgeIsRejected) {
  EXPECT_THROW(policy.maxAge(std::chrono::seconds{-1}), std::invalid_argument);
}

TEST_F(CorsPolicyTest, MiddlewareShortCircuitsPreflightOnly) {
  const MiddlewareEntry entry = CorsMiddleware(CorsPolicy{});
  EXPECT_EQ(entry.name, "cors");

  HttpRequest preflight =
      Build(http::Method::OPTIONS, {{"Origin", "https://a.example"}, {"Access-Control-Request-Method", "PUT"}});
  MiddlewareResult result = entry.before(preflight);
  ASSERT_TRUE(result.shouldShortCircuit());
  const HttpResponse preflightResponse = std::move(result).takeResponse();
  EXPECT_EQ(preflightResponse.headerValue(http::AccessControlAllowHeaders), "*");

  HttpRequest simple = Build(http::Method::GET, {{"Origin", "https://a.example"}});
  EXPECT_TRUE(entry.before(simple).shouldContinue());
  entry.after(simple, response);
  EXPECT_EQ(response.headerValue(http::AccessControlAllowOrigin), "*");
}

}  // namespace ignyx

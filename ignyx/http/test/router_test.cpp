#include "ignyx/router.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ignyx/http-method.hpp"
#include "ignyx/router-config.hpp"

namespace ignyx {

using TestRouter = Router<std::string>;
using Kind = TestRouter::Match::Kind;

class RouterTest : public ::testing::Test {
 protected:
  TestRouter router;
};

TEST_F(RouterTest, LiteralBeatsParameterWhateverTheRegistrationOrder) {
  router.add(http::Method::GET, "/users/{user_id}", "by-id");
  router.add(http::Method::GET, "/users/me", "me");

  auto match = router.match(http::Method::GET, "/users/me");
  ASSERT_EQ(match.kind, Kind::Matched);
  EXPECT_EQ(*match.target, "me");
  EXPECT_TRUE(match.pathParams.empty());

  match = router.match(http::Method::GET, "/users/42");
  ASSERT_EQ(match.kind, Kind::Matched);
  EXPECT_EQ(*match.target, "by-id");
  ASSERT_EQ(match.pathParams.size(), 1U);
  EXPECT_EQ(match.pathParams[0].name, "user_id");
  EXPECT_EQ(match.pathParams[0].value, "42");
}

TEST_F(RouterTest, ReverseRegistrationOrderGivesSameResult) {
  router.add(http::Method::GET, "/users/me", "me");
  router.add(http::Method::GET, "/users/{user_id}", "by-id");
  EXPECT_EQ(*router.match(http::Method::GET, "/users/me").target, "me");
  EXPECT_EQ(*router.match(http::Method::GET, "/users/7").target, "by-id");
}

TEST_F(RouterTest, BacktracksFromLiteralToParameter) {
  router.add(http::Method::GET, "/files/static/index", "static-index");
  router.add(http::Method::GET, "/files/{dir}/raw", "raw");
  auto match = router.match(http::Method::GET, "/files/static/raw");
  ASSERT_EQ(match.kind, Kind::Matched);
  EXPECT_EQ(*match.target, "raw");
  EXPECT_EQ(match.pathParams[0].value, "static");
}

TEST_F(RouterTest, CatchAllCapturesRemainder) {
  router.add(http::Method::GET, "/static/{rest:path}", "files");
  auto match = router.match(http::Method::GET, "/static/css/site.css");
  ASSERT_EQ(match.kind, Kind::Matched);
  EXPECT_EQ(match.pathParams[0].name, "rest");
  EXPECT_EQ(match.pathParams[0].value, "css/site.css");
}

TEST_F(RouterTest, EmptySegmentDoesNotMatchParameter) {
  router.add(http::Method::GET, "/users/{id}/posts", "posts");
  EXPECT_EQ(router.match(http::Method::GET, "/users//posts").kind, Kind::NotFound);
}

TEST_F(RouterTest, MethodNotAllowedReportsAllowedMethods) {
  router.add(http::Method::GET, "/items", "list");
  router.add(http::Method::POST, "/items", "create");
  auto match = router.match(http::Method::DELETE, "/items");
  ASSERT_EQ(match.kind, Kind::MethodNotAllowed);
  EXPECT_TRUE(http::IsMethodSet(match.allowedMethods, http::Method::GET));
  EXPECT_TRUE(http::IsMethodSet(match.allowedMethods, http::Method::HEAD));
  EXPECT_TRUE(http::IsMethodSet(match.allowedMethods, http::Method::POST));
  EXPECT_FALSE(http::IsMethodSet(match.allowedMethods, http::Method::DELETE));
}

TEST_F(RouterTest, HeadFallsBackToGet) {
  router.add(http::Method::GET, "/health", "health");
  auto match = router.match(http::Method::HEAD, "/health");
  ASSERT_EQ(match.kind, Kind::Matched);
  EXPECT_EQ(*match.target, "health");
}

TEST_F(RouterTest, SameShapeConflicts) {
  router.add(http::Method::GET, "/users/{id}", "a");
  EXPECT_THROW(router.add(http::Method::GET, "/users/{name}", "b"), RouteConflict);
  // Another method on the same shape is fine.
  EXPECT_NO_THROW(router.add(http::Method::PUT, "/users/{name}", "c"));
  EXPECT_EQ(router.size(), 2U);
}

TEST_F(RouterTest, InvalidTemplates) {
  EXPECT_THROW(router.add(http::Method::GET, "users", "x"), std::invalid_argument);
  EXPECT_THROW(router.add(http::Method::GET, "/a//b", "x"), std::invalid_argument);
  EXPECT_THROW(router.add(http::Method::GET, "/a/{id", "x"), std::invalid_argument);
  EXPECT_THROW(router.add(http::Method::GET, "/a/pre{id}", "x"), std::invalid_argument);
  EXPECT_THROW(router.add(http::Method::GET, "/a/{id}/{id}", "x"), std::invalid_argument);
  EXPECT_THROW(router.add(http::Method::GET, "/a/{rest:path}/b", "x"), std::invalid_argument);
  EXPECT_THROW(router.add(http::Method::GET, "/a/{id:int}", "x"), std::invalid_argument);
}

TEST_F(RouterTest, RootPath) {
  router.add(http::Method::GET, "/", "root");
  auto match = router.match(http::Method::GET, "/");
  ASSERT_EQ(match.kind, Kind::Matched);
  EXPECT_EQ(*match.target, "root");
}

TEST_F(RouterTest, EncodedSlashStaysInsideItsSegment) {
  router.add(http::Method::GET, "/files/{name}", "file");
  router.add(http::Method::GET, "/files/{dir}/{name}", "nested");
  router.add(http::Method::GET, "/static/{rest:path}", "static");

  auto match = router.match(http::Method::GET, "/files/a%2Fb");
  ASSERT_EQ(match.kind, Kind::Matched);
  EXPECT_EQ(*match.target, "file");
  ASSERT_EQ(match.pathParams.size(), 1U);
  EXPECT_EQ(match.pathParams[0].value, "a/b");

  match = router.match(http::Method::GET, "/files/a%20b/c%2Fd");
  ASSERT_EQ(match.kind, Kind::Matched);
  EXPECT_EQ(*match.target, "nested");
  EXPECT_EQ(match.pathParams[0].value, "a b");
  EXPECT_EQ(match.pathParams[1].value, "c/d");

  match = router.match(http::Method::GET, "/static/css/a%2Fb.css");
  ASSERT_EQ(match.kind, Kind::Matched);
  EXPECT_EQ(match.pathParams[0].value, "css/a/b.css");
}

TEST_F(RouterTest, EncodedLiteralSegmentMatchesDecoded) {
  router.add(http::Method::GET, "/users/me", "me");
  router.add(http::Method::GET, "/users/{id}", "by-id");
  EXPECT_EQ(*router.match(http::Method::GET, "/users/m%65").target, "me");
}

TEST_F(RouterTest, ClearThenRegisterAgainMatchesTheSame) {
  const std::pair<std::string_view, std::string_view> routes[] = {{"/users/me", "me"},
                                                                   {"/users/{id}", "by-id"},
                                                                   {"/users/{id}/posts/{post}", "post"},
                                                                   {"/static/{rest:path}", "static"}};
  const std::string_view paths[] = {"/users/me", "/users/42", "/users/42/posts/7", "/static/css/site.css", "/nope"};

  auto registerAll = [this, &routes] {
    for (const auto& [pattern, target] : routes) {
      router.add(http::Method::GET, pattern, std::string(target));
    }
  };
  auto matchAll = [this, &paths] {
    std::vector<std::pair<std::string, std::vector<std::string>>> results;
    for (std::string_view path : paths) {
      auto match = router.match(http::Method::GET, path);
      std::vector<std::string> params;
      for (const PathParam& param : match.pathParams) {
        params.push_back(param.name + "=" + param.value);
      }
      results.emplace_back(match.target == nullptr ? std::string("<none>") : *match.target, std::move(params));
    }
    return results;
  };

  registerAll();
  EXPECT_EQ(router.size(), 4U);
  const auto before = matchAll();

  router.clear();
  EXPECT_EQ(router.size(), 0U);
  EXPECT_EQ(router.match(http::Method::GET, "/users/me").kind, Kind::NotFound);

  // No conflict with the routes registered before clear().
  EXPECT_NO_THROW(registerAll());
  EXPECT_EQ(router.size(), 4U);
  EXPECT_EQ(matchAll(), before);
  EXPECT_EQ(before[1].first, "by-id");
  EXPECT_EQ(before[2].second, (std::vector<std::string>{"id=42", "post=7"}));
}

TEST(RouterTrailingSlash, StrictPolicy) {
  TestRouter router(RouterConfig{}.withTrailingSlashPolicy(RouterConfig::TrailingSlashPolicy::Strict));
  router.add(http::Method::GET, "/items", "items");
  EXPECT_EQ(router.match(http::Method::GET, "/items/").kind, Kind::NotFound);
}

TEST(RouterTrailingSlash, NormalizePolicyMatchesBothWays) {
  TestRouter router(RouterConfig{}.withTrailingSlashPolicy(RouterConfig::TrailingSlashPolicy::Normalize));
  router.add(http::Method::GET, "/items", "items");
  router.add(http::Method::GET, "/folders/", "folders");
  EXPECT_EQ(*router.match(http::Method::GET, "/items/").target, "items");
  EXPECT_EQ(*router.match(http::Method::GET, "/folders").target, "folders");
}

TEST(RouterTrailingSlash, RedirectPolicy) {
  TestRouter router(RouterConfig{}.withTrailingSlashPolicy(RouterConfig::TrailingSlashPolicy::Redirect));
  router.add(http::Method::GET, "/items", "items");
  auto match = router.match(http::Method::GET, "/items/");
  ASSERT_EQ(match.kind, Kind::Redirect);
  EXPECT_EQ(match.redirectPath, "/items");
}

}  // namespace ignyx

#include "wayfarer/response-builders.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "wayfarer/http-context.hpp"
#include "wayfarer/http-status.hpp"
#include "wayfarer/runtime-config.hpp"
#include "wayfarer/test-util.hpp"

namespace wayfarer {

namespace {

test::ParsedResponse Run(const Handler& app, std::shared_ptr<const RuntimeConfig> runtime = {}) {
  const auto outcome = app(test::MakeContext("/", std::move(runtime)));
  EXPECT_TRUE(outcome);
  return test::ParseResponse(test::WriteToString(*outcome));
}

}  // namespace

TEST(ResponseBuilders, TextBuildersSetTheirStatus) {
  using TextBuilder = std::function<Handler(std::string_view)>;
  const std::vector<std::pair<TextBuilder, int>> builders{
      {Ok, 200},
      {Created, 201},
      {Accepted, 202},
      {BadRequest, 400},
      {Unauthorized, 401},
      {Forbidden, 403},
      {NotFound, 404},
      {MethodNotAllowed, 405},
      {NotAcceptable, 406},
      {RequestTimeout, 408},
      {Conflict, 409},
      {Gone, 410},
      {UnsupportedMediaType, 415},
      {UnprocessableEntity, 422},
      {PreconditionRequired, 428},
      {TooManyRequests, 429},
      {InternalError, 500},
      {NotImplemented, 501},
      {BadGateway, 502},
      {ServiceUnavailable, 503},
      {GatewayTimeout, 504},
      {InvalidHttpVersion, 505}};
  for (const auto& [builder, code] : builders) {
    const auto resp = wayfarer::Run(builder("some text"));
    EXPECT_EQ(resp.statusCode, code);
    EXPECT_EQ(resp.body, "some text");
    EXPECT_EQ(resp.header("Content-Length"), "9");
  }
}

TEST(ResponseBuilders, BytesBuilders) {
  const std::string raw("\x00\x01\xff", 3);
  const auto resp = wayfarer::Run(OkBytes(AsBytes(raw)));
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.body, raw);

  EXPECT_EQ(wayfarer::Run(ConflictBytes(AsBytes("c"))).statusCode, 409);
  EXPECT_EQ(wayfarer::Run(InternalErrorBytes(AsBytes("e"))).statusCode, 500);
}

TEST(ResponseBuilders, NoBodyStatuses) {
  const auto noContent = wayfarer::Run(NoContent());
  EXPECT_EQ(noContent.statusCode, 204);
  EXPECT_FALSE(noContent.header("Content-Length"));

  const auto notModified = wayfarer::Run(NotModified());
  EXPECT_EQ(notModified.statusCode, 304);
  EXPECT_TRUE(notModified.body.empty());
}

TEST(ResponseBuilders, MovedPermanentlyAndFound) {
  const auto moved = wayfarer::Run(MovedPermanently("/new"));
  EXPECT_EQ(moved.statusCode, 301);
  EXPECT_EQ(moved.header("Location"), "/new");
  EXPECT_EQ(moved.header("Content-Length"), "0");
  EXPECT_TRUE(moved.body.empty());

  const auto found = wayfarer::Run(Found("https://example.com/x"));
  EXPECT_EQ(found.statusCode, 302);
  EXPECT_EQ(found.header("Location"), "https://example.com/x");
}

TEST(ResponseBuilders, RedirectHasHtmlBody) {
  const auto resp = wayfarer::Run(Redirect("/target?a=1&b=2"));
  EXPECT_EQ(resp.statusCode, 302);
  EXPECT_EQ(resp.header("Location"), "/target?a=1&b=2");
  EXPECT_EQ(resp.header("Content-Type"), "text/html; charset=utf-8");
  EXPECT_EQ(resp.body,
            "<html>\n  <body>\n    <a href=\"/target?a=1&amp;b=2\">Content Moved</a>\n  </body>\n</html>");
}

TEST(ResponseBuilders, ChallengeUsesConfiguredRealm) {
  const auto defaultResp = wayfarer::Run(Challenge());
  EXPECT_EQ(defaultResp.statusCode, 401);
  EXPECT_EQ(defaultResp.header("WWW-Authenticate"), "Basic realm=\"protected\"");
  EXPECT_EQ(defaultResp.body, http::StatusMessage(http::Status::Unauthorized));

  auto runtime = std::make_shared<RuntimeConfig>();
  runtime->withAuthRealm("admin area");
  EXPECT_EQ(wayfarer::Run(Challenge(), runtime).header("WWW-Authenticate"), "Basic realm=\"admin area\"");
}

}  // namespace wayfarer

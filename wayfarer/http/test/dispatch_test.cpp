#include "wayfarer/dispatch.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "wayfarer/combinators.hpp"
#include "wayfarer/http-context.hpp"
#include "wayfarer/response-builders.hpp"
#include "wayfarer/route-matchers.hpp"
#include "wayfarer/runtime-config.hpp"
#include "wayfarer/string-sink.hpp"
#include "wayfarer/test-util.hpp"

namespace wayfarer {

namespace {

const Handler kThrowing = [](const HttpContext&) -> RouteResult<HttpContext> {
  throw std::runtime_error("database unreachable");
};

}  // namespace

TEST(Dispatch, MatchedOutcome) {
  const auto outcome = Dispatch(Url("/") >> Ok("root"), test::MakeContext("/"));
  ASSERT_TRUE(outcome);
  EXPECT_EQ(*outcome->response.bytes(), "root");
}

TEST(Dispatch, NoMatch) { EXPECT_FALSE(Dispatch(Url("/other") >> Ok("x"), test::MakeContext("/"))); }

TEST(Dispatch, ExceptionIsInternalServerError) {
  const Handler app = SetHeader("X-Partial", "1") >> kThrowing;
  const auto outcome = Dispatch(app, test::MakeContext("/"));
  ASSERT_TRUE(outcome);
  EXPECT_EQ(outcome->response.status(), http::Status::InternalServerError);
  EXPECT_FALSE(outcome->response.headerValue("X-Partial"));
  EXPECT_EQ(outcome->response.headerValue("Content-Type"), "text/plain; charset=utf-8");
  EXPECT_EQ(*outcome->response.bytes(), http::StatusMessage(http::Status::InternalServerError));
}

TEST(Dispatch, ExceptionDetailsWhenExposed) {
  auto runtime = std::make_shared<RuntimeConfig>();
  runtime->withExposeErrorDetails();
  const auto outcome = Dispatch(kThrowing, test::MakeContext("/", runtime));
  ASSERT_TRUE(outcome);
  EXPECT_EQ(outcome->response.status(), http::Status::InternalServerError);
  EXPECT_EQ(*outcome->response.bytes(), "database unreachable");
}

TEST(Serve, WritesResponse) {
  test::StringSink sink;
  auto task = Serve(Ok("served"), test::MakeContext("/"), sink);
  ASSERT_TRUE(task);
  task->runSynchronously();
  const auto resp = test::ParseResponse(sink.data());
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.body, "served");
}

TEST(Serve, NoMatchWritesNothing) {
  test::StringSink sink;
  EXPECT_FALSE(Serve(Never, test::MakeContext("/"), sink));
  EXPECT_EQ(sink.nbWrites(), 0U);
}

TEST(Serve, ExceptionIsWrittenAs500) {
  test::StringSink sink;
  auto task = Serve(kThrowing, test::MakeContext("/"), sink);
  ASSERT_TRUE(task);
  task->runSynchronously();
  EXPECT_EQ(test::ParseResponse(sink.data()).statusCode, 500);
}

TEST(RespondToInvalidRequestLine, VersionNotSupportedAndClose) {
  test::StringSink sink;
  RespondToInvalidRequestLine(test::MakeContext("/"), sink).runSynchronously();
  const auto resp = test::ParseResponse(sink.data());
  EXPECT_EQ(resp.statusCode, 505);
  EXPECT_EQ(resp.header("Connection"), "close");
  EXPECT_EQ(resp.body, http::StatusMessage(http::Status::HTTPVersionNotSupported));
  EXPECT_EQ(resp.header("Content-Length"), std::to_string(resp.body.size()));
}

}  // namespace wayfarer

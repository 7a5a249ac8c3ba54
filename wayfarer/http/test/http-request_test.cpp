#include "wayfarer/http-request.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

#include "wayfarer/http-method.hpp"

namespace wayfarer {

TEST(HttpRequest, Defaults) {
  HttpRequest request;
  EXPECT_EQ(request.method(), http::Method::GET);
  EXPECT_EQ(request.path(), "/");
  EXPECT_EQ(request.version(), http::HTTP11Sv);
  EXPECT_TRUE(request.headers().empty());
  EXPECT_FALSE(request.isSecure());
}

TEST(HttpRequest, TargetSplitsAndDecodes) {
  HttpRequest request;
  request.withTarget("/path%2Caaa/a+b?key=val%20ue&flag&x=1+2");
  EXPECT_EQ(request.path(), "/path,aaa/a+b");
  EXPECT_EQ(request.rawQuery(), "key=val%20ue&flag&x=1+2");
  ASSERT_EQ(request.queryParams().size(), 3U);
  EXPECT_EQ(request.queryParam("key"), "val ue");
  EXPECT_EQ(request.queryParam("flag"), "");
  EXPECT_EQ(request.queryParam("x"), "1 2");
  EXPECT_FALSE(request.queryParam("missing"));
}

TEST(HttpRequest, TargetWithoutQuery) {
  HttpRequest request;
  request.withTarget("/a?b=c").withTarget("/other");
  EXPECT_EQ(request.path(), "/other");
  EXPECT_TRUE(request.rawQuery().empty());
  EXPECT_TRUE(request.queryParams().empty());
}

TEST(HttpRequest, HeaderLookupIsCaseInsensitiveLastWins) {
  HttpRequest request;
  request.withHeader("X-Custom", "  first ").withHeader("x-custom", "second").withHeader("Empty", "");
  EXPECT_EQ(request.headerValue("X-CUSTOM"), "second");
  EXPECT_EQ(request.headerValue("empty"), "");
  EXPECT_FALSE(request.headerValue("absent"));
  EXPECT_EQ(request.headerValueOrEmpty("absent"), "");
  ASSERT_EQ(request.headers().size(), 3U);
  EXPECT_EQ(request.headers()[0].second, "first");
}

TEST(HttpRequest, HostWithoutPort) {
  HttpRequest request;
  EXPECT_EQ(request.host(), "");
  request.withHeader("Host", "example.com:8080");
  EXPECT_EQ(request.host(), "example.com");

  HttpRequest ipv6;
  ipv6.withHeader("Host", "[::1]:443");
  EXPECT_EQ(ipv6.host(), "[::1]");
}

TEST(HttpRequest, FormParamsOnlyForFormContentType) {
  HttpRequest request;
  request.withBody("name=John+Doe&age=42");
  EXPECT_TRUE(request.formParams().empty());

  request.withHeader("Content-Type", "application/x-www-form-urlencoded; charset=utf-8");
  const auto params = request.formParams();
  ASSERT_EQ(params.size(), 2U);
  EXPECT_EQ(request.formParam("name"), "John Doe");
  EXPECT_EQ(request.formParam("age"), "42");
  EXPECT_FALSE(request.formParam("other"));
}

TEST(HttpRequest, Cookies) {
  HttpRequest request;
  request.withHeader("Cookie", "session=abc; theme=\"dark\"").withHeader("Cookie", "lang=fr");
  EXPECT_EQ(request.cookie("session"), "abc");
  EXPECT_EQ(request.cookie("theme"), "dark");
  EXPECT_EQ(request.cookie("lang"), "fr");
  EXPECT_FALSE(request.cookie("missing"));
}

TEST(HttpRequest, TransportAttributes) {
  HttpRequest request;
  request.withMethod(http::Method::POST).withSecure().withRemoteAddress("10.0.0.1").withVersion(http::HTTP10Sv);
  EXPECT_EQ(request.method(), http::Method::POST);
  EXPECT_TRUE(request.isSecure());
  EXPECT_EQ(request.remoteAddress(), "10.0.0.1");
  EXPECT_EQ(request.version(), "HTTP/1.0");
}

}  // namespace wayfarer

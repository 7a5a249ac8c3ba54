#include "wayfarer/http-response.hpp"

#include <gtest/gtest.h>

#include <string>

#include "wayfarer/http-cookie.hpp"
#include "wayfarer/http-status.hpp"

namespace wayfarer {

TEST(HttpResponse, DefaultIsNotFoundWithoutBody) {
  HttpResponse response;
  EXPECT_EQ(response.status(), http::Status::NotFound);
  EXPECT_FALSE(response.hasBody());
  EXPECT_EQ(response.bytes(), nullptr);
  EXPECT_EQ(response.producer(), nullptr);
}

TEST(HttpResponse, HeaderReplacesCaseInsensitive) {
  HttpResponse response;
  response.header("X-A", "1").header("X-B", "2").addHeader("x-a", "3");
  ASSERT_EQ(response.headers().size(), 3U);

  response.header("X-a", "4");
  ASSERT_EQ(response.headers().size(), 2U);
  EXPECT_EQ(response.headers()[0].first, "X-A");
  EXPECT_EQ(response.headers()[0].second, "4");
  EXPECT_EQ(response.headerValue("x-b"), "2");
}

TEST(HttpResponse, AddHeaderKeepsPreviousValues) {
  HttpResponse response;
  response.addHeader("Vary", "Accept").addHeader("Vary", "Accept-Encoding");
  ASSERT_EQ(response.headers().size(), 2U);
  EXPECT_EQ(response.headerValue("vary"), "Accept-Encoding");

  response.removeHeader("VARY");
  EXPECT_TRUE(response.headers().empty());
  EXPECT_FALSE(response.headerValue("Vary"));
}

TEST(HttpResponse, CookiesLastWriterWinsPerName) {
  HttpResponse response;
  response.cookie(HttpCookie("a", "1")).cookie(HttpCookie("b", "2")).cookie(HttpCookie("a", "3"));
  ASSERT_EQ(response.cookies().size(), 2U);
  EXPECT_EQ(response.cookies()[0].name(), "a");
  EXPECT_EQ(response.cookies()[0].value(), "3");
  EXPECT_EQ(response.cookies()[1].value(), "2");
}

TEST(HttpResponse, Content) {
  HttpResponse response;
  response.body(std::string("payload"));
  ASSERT_NE(response.bytes(), nullptr);
  EXPECT_EQ(*response.bytes(), "payload");
  EXPECT_TRUE(response.hasBody());

  response.body(BodyProducer([](const HttpContext&, ResponseSink& sink) { return sink.write("x"); }));
  EXPECT_EQ(response.bytes(), nullptr);
  EXPECT_NE(response.producer(), nullptr);

  response.clearBody();
  EXPECT_FALSE(response.hasBody());
}

}  // namespace wayfarer

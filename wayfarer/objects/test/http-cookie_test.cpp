#include "wayfarer/http-cookie.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "wayfarer/timestring.hpp"

namespace wayfarer {

TEST(HttpCookie, Minimal) { EXPECT_EQ(HttpCookie("sid", "abc123").toSetCookieValue(), "sid=abc123"); }

TEST(HttpCookie, AllAttributes) {
  HttpCookie cookie("sid", "abc");
  cookie.withPath("/")
      .withDomain("example.com")
      .withExpires(SysTimePoint{std::chrono::sys_days{std::chrono::year{2015} / 10 / 21}})
      .withSecure()
      .withHttpOnly()
      .withSameSite(HttpCookie::SameSite::Lax);
  EXPECT_EQ(cookie.toSetCookieValue(),
            "sid=abc; Expires=Wed, 21 Oct 2015 00:00:00 GMT; Domain=example.com; Path=/; Secure; HttpOnly; "
            "SameSite=Lax");
}

TEST(HttpCookie, Expired) {
  const HttpCookie cookie = HttpCookie::Expired("sid");
  EXPECT_EQ(cookie.value(), "");
  EXPECT_EQ(cookie.toSetCookieValue(), "sid=; Expires=Thu, 01 Jan 1970 00:00:00 GMT");
}

TEST(HttpCookie, InvalidNameOrValue) {
  EXPECT_THROW(HttpCookie("", "v"), std::invalid_argument);
  EXPECT_THROW(HttpCookie("a b", "v"), std::invalid_argument);
  EXPECT_THROW(HttpCookie("a=b", "v"), std::invalid_argument);
  EXPECT_THROW(HttpCookie("a", "x;y"), std::invalid_argument);
  EXPECT_THROW(HttpCookie("a", "x y"), std::invalid_argument);
  HttpCookie ok("a", "b");
  EXPECT_THROW(ok.withPath("/x;y"), std::invalid_argument);
}

TEST(HttpCookie, ParseHeader) {
  const auto cookies = ParseCookieHeader("a=1; b = \"two\" ;flag; =x; c=");
  const std::vector<std::pair<std::string, std::string>> expected{{"a", "1"}, {"b", "two"}, {"c", ""}};
  EXPECT_EQ(cookies, expected);
}

}  // namespace wayfarer

#include "wayfarer/http-status.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <iterator>
#include <optional>

namespace wayfarer::http {

TEST(HttpStatus, RoundTripForEveryStatus) {
  for (const StatusEntry &entry : kAllStatuses) {
    const auto parsed = TryParseStatus(StatusCode(entry.status));
    ASSERT_TRUE(parsed.has_value()) << StatusCode(entry.status);
    EXPECT_EQ(*parsed, entry.status);
  }
}

TEST(HttpStatus, UnknownIntegersAreUnrecognized) {
  for (int code : {0, -1, 99, 102, 207, 306, 308, 418, 421, 451, 506, 600, 1000}) {
    EXPECT_EQ(TryParseStatus(code), std::nullopt) << code;
  }
}

TEST(HttpStatus, TableSortedAndUnique) {
  for (std::size_t pos = 1; pos < std::size(kAllStatuses); ++pos) {
    EXPECT_LT(StatusCode(kAllStatuses[pos - 1].status), StatusCode(kAllStatuses[pos].status));
  }
}

TEST(HttpStatus, ReasonAndMessage) {
  EXPECT_EQ(ReasonPhrase(Status::OK), "OK");
  EXPECT_EQ(ReasonPhrase(Status::NotFound), "Not Found");
  EXPECT_EQ(ReasonPhrase(Status::HTTPVersionNotSupported), "HTTP Version Not Supported");
  EXPECT_EQ(StatusMessage(Status::NotFound), "Nothing matches the given URI");
  EXPECT_EQ(StatusCode(Status::TooManyRequests), 429);
  for (const StatusEntry &entry : kAllStatuses) {
    EXPECT_FALSE(ReasonPhrase(entry.status).empty());
    EXPECT_FALSE(StatusMessage(entry.status).empty());
  }
}

TEST(HttpStatus, BodyForbidden) {
  EXPECT_TRUE(IsBodyForbidden(Status::Continue));
  EXPECT_TRUE(IsBodyForbidden(Status::SwitchingProtocols));
  EXPECT_TRUE(IsBodyForbidden(Status::NoContent));
  EXPECT_TRUE(IsBodyForbidden(Status::NotModified));
  EXPECT_FALSE(IsBodyForbidden(Status::OK));
  EXPECT_FALSE(IsBodyForbidden(Status::ResetContent));
  EXPECT_FALSE(IsBodyForbidden(Status::NotFound));
}

TEST(HttpStatus, Classes) {
  EXPECT_TRUE(IsClientError(Status::Unauthorized));
  EXPECT_FALSE(IsClientError(Status::InternalServerError));
  EXPECT_TRUE(IsServerError(Status::GatewayTimeout));
}

}  // namespace wayfarer::http

#include "wayfarer/base64.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

namespace wayfarer {

TEST(Base64, EncodeEmpty) { EXPECT_EQ(B64Encode(std::string_view("")), ""); }
TEST(Base64, Encode1) { EXPECT_EQ(B64Encode(std::string_view("f")), "Zg=="); }
TEST(Base64, Encode2) { EXPECT_EQ(B64Encode(std::string_view("fo")), "Zm8="); }
TEST(Base64, Encode3) { EXPECT_EQ(B64Encode(std::string_view("foo")), "Zm9v"); }
TEST(Base64, Encode4) { EXPECT_EQ(B64Encode(std::string_view("foob")), "Zm9vYg=="); }
TEST(Base64, Encode6) { EXPECT_EQ(B64Encode(std::string_view("foobar")), "Zm9vYmFy"); }

TEST(Base64, EncodedLen) {
  EXPECT_EQ(B64EncodedLen(0), 0U);
  EXPECT_EQ(B64EncodedLen(1), 4U);
  EXPECT_EQ(B64EncodedLen(3), 4U);
  EXPECT_EQ(B64EncodedLen(4), 8U);
}

TEST(Base64, DecodePadded) {
  EXPECT_EQ(B64Decode("Zg=="), "f");
  EXPECT_EQ(B64Decode("Zm8="), "fo");
  EXPECT_EQ(B64Decode("Zm9vYmFy"), "foobar");
}

TEST(Base64, DecodeWithoutPadding) {
  EXPECT_EQ(B64Decode("Zg"), "f");
  EXPECT_EQ(B64Decode("Zm8"), "fo");
}

TEST(Base64, DecodeWithWhitespace) {
  EXPECT_EQ(B64Decode("Zm9v YmFy"), "foobar");
  EXPECT_EQ(B64Decode("Zm9v\nYmFy"), "foobar");
  EXPECT_EQ(B64Decode(" Zm9vYmFy "), "foobar");
}

TEST(Base64, DecodeCredentials) { EXPECT_EQ(B64Decode("QWxhZGRpbjpvcGVuIHNlc2FtZQ=="), "Aladdin:open sesame"); }

TEST(Base64, DecodeInvalidCharacter) {
  EXPECT_FALSE(B64Decode("Zm9v*mFy").has_value());
  EXPECT_FALSE(B64Decode("Zm9v-mFy").has_value());
}

TEST(Base64, DecodeDanglingSextet) { EXPECT_FALSE(B64Decode("Zm9vY").has_value()); }

TEST(Base64, BinaryData) {
  const std::string bin("\x00\xff\x10\x80", 4);
  const std::string encoded = B64Encode(bin);
  EXPECT_EQ(encoded, "AP8QgA==");
  EXPECT_EQ(B64Decode(encoded), bin);
}

}  // namespace wayfarer

#include <gtest/gtest.h>

#include <string>

#include "latchkey/security/encoding.hpp"

using namespace latchkey::security::encoding;

TEST(HexTest, EncodesLowercase) {
    EXPECT_EQ(toHex(std::string("\x00\x01\xab\xff", 4)), "0001abff");
    EXPECT_EQ(toHex(std::string_view()), "");
}

TEST(HexTest, DecodesEitherCase) {
    auto lower = fromHex("0001abff");
    ASSERT_TRUE(lower.has_value());
    EXPECT_EQ(*lower, std::string("\x00\x01\xab\xff", 4));

    auto upper = fromHex("ABFF");
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(*upper, std::string("\xab\xff", 2));
}

TEST(HexTest, RejectsMalformedInput) {
    EXPECT_FALSE(fromHex("abc").has_value());
    EXPECT_FALSE(fromHex("zz").has_value());
    EXPECT_FALSE(fromHex("0g").has_value());
    auto empty = fromHex("");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(Base64Test, KnownVectors) {
    EXPECT_EQ(base64Encode("f"), "Zg==");
    EXPECT_EQ(base64Encode("fo"), "Zm8=");
    EXPECT_EQ(base64Encode("foobar"), "Zm9vYmFy");
    EXPECT_EQ(base64Encode(""), "");
}

TEST(Base64Test, DecodeDropsPadding) {
    EXPECT_EQ(base64Decode("Zg=="), "f");
    EXPECT_EQ(base64Decode("Zm8="), "fo");
    EXPECT_EQ(base64Decode("Zm9vYmFy"), "foobar");
    EXPECT_EQ(base64Decode(""), "");
}

TEST(Base64Test, BinaryPayloadSurvives) {
    std::string bytes("\x00\xff\x10:\x7f", 5);
    EXPECT_EQ(base64Decode(base64Encode(bytes)), bytes);
}

TEST(Base64Test, RejectsMalformedInput) {
    EXPECT_FALSE(base64Decode("Zm9").has_value());
    EXPECT_FALSE(base64Decode("Zm9v!!!!").has_value());
}

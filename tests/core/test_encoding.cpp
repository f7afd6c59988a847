// PYTHCLIENT - Encoding Tests
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License

#include <gtest/gtest.h>
#include "pythclient/core/encoding.h"

#include <stdexcept>

namespace pythclient {
namespace test {

namespace {

std::vector<uint8_t> Bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace

// ============================================================================
// Hex Tests
// ============================================================================

TEST(HexTest, EncodesLowercase) {
    std::vector<uint8_t> data = {0x00, 0x0F, 0xAB, 0xFF};
    EXPECT_EQ(BytesToHex(data), "000fabff");
    EXPECT_EQ(BytesToHex(std::vector<uint8_t>{}), "");
}

TEST(HexTest, DecodesMixedCase) {
    auto bytes = HexToBytes("DeadBEEF");
    ASSERT_EQ(bytes.size(), 4);
    EXPECT_EQ(bytes[0], 0xDE);
    EXPECT_EQ(bytes[3], 0xEF);
}

TEST(HexTest, RejectsMalformed) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("0g"));
    EXPECT_TRUE(IsValidHex("00ff"));
}

// ============================================================================
// Base58 Tests
// ============================================================================

TEST(Base58Test, KnownVectors) {
    EXPECT_EQ(EncodeBase58(std::vector<uint8_t>{}), "");
    EXPECT_EQ(EncodeBase58(HexToBytes("61")), "2g");
    EXPECT_EQ(EncodeBase58(HexToBytes("626262")), "a3gV");
    EXPECT_EQ(EncodeBase58(HexToBytes("636363")), "aPEr");
    EXPECT_EQ(EncodeBase58(HexToBytes("572e4794")), "3EFU7m");
    EXPECT_EQ(EncodeBase58(Bytes("Hello World!")), "2NEpo7TZRRrLZSi2U");
}

TEST(Base58Test, LeadingZerosBecomeOnes) {
    EXPECT_EQ(EncodeBase58(HexToBytes("0000287fb4cd")), "111233QC4");
    EXPECT_EQ(EncodeBase58(HexToBytes("000000")), "111");

    auto decoded = DecodeBase58("111233QC4");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(BytesToHex(*decoded), "0000287fb4cd");
}

TEST(Base58Test, DecodeKnownVectors) {
    auto decoded = DecodeBase58("2NEpo7TZRRrLZSi2U");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, Bytes("Hello World!"));

    auto empty = DecodeBase58("");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(Base58Test, DecodeRejectsInvalidCharacters) {
    EXPECT_FALSE(DecodeBase58("0").has_value());
    EXPECT_FALSE(DecodeBase58("abc O").has_value());
    EXPECT_FALSE(DecodeBase58("I1").has_value());
}

TEST(Base58Test, RoundTripsArbitraryBytes) {
    std::vector<uint8_t> data;
    for (int i = 0; i < 64; ++i) {
        data.push_back(static_cast<uint8_t>(i * 37 + 11));
    }
    auto decoded = DecodeBase58(EncodeBase58(data));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
}

// ============================================================================
// Base64 Tests
// ============================================================================

TEST(Base64Test, DecodesWithAndWithoutPadding) {
    auto man = DecodeBase64("TWFu");
    ASSERT_TRUE(man.has_value());
    EXPECT_EQ(*man, Bytes("Man"));

    auto ma = DecodeBase64("TWE=");
    ASSERT_TRUE(ma.has_value());
    EXPECT_EQ(*ma, Bytes("Ma"));

    auto m = DecodeBase64("TQ==");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(*m, Bytes("M"));
}

TEST(Base64Test, EmptyInputIsEmptyOutput) {
    auto empty = DecodeBase64("");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
    EXPECT_EQ(EncodeBase64(std::vector<uint8_t>{}), "");
}

TEST(Base64Test, PreservesZeroBytes) {
    auto decoded = DecodeBase64("AAAA");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, std::vector<uint8_t>(3, 0));
}

TEST(Base64Test, RejectsMalformedInput) {
    EXPECT_FALSE(DecodeBase64("TWF").has_value());
    EXPECT_FALSE(DecodeBase64("T@==").has_value());
}

TEST(Base64Test, EncodeMatchesKnownVectors) {
    EXPECT_EQ(EncodeBase64(Bytes("Man")), "TWFu");
    EXPECT_EQ(EncodeBase64(Bytes("Ma")), "TWE=");
    EXPECT_EQ(EncodeBase64(Bytes("M")), "TQ==");
}

TEST(Base64Test, RoundTripsBinary) {
    std::vector<uint8_t> data;
    for (int i = 0; i < 256; ++i) {
        data.push_back(static_cast<uint8_t>(i));
    }
    auto decoded = DecodeBase64(EncodeBase64(data));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
}

} // namespace test
} // namespace pythclient

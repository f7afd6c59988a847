// PYTHCLIENT - Core Types Tests
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License

#include <gtest/gtest.h>
#include "pythclient/core/types.h"

#include <map>
#include <unordered_set>

namespace pythclient {
namespace test {

// ============================================================================
// Byte / Span Tests
// ============================================================================

TEST(ByteTest, SizeIsOneByte) {
    EXPECT_EQ(sizeof(Byte), 1);
}

TEST(SpanTest, ViewsVectorWithoutCopy) {
    std::vector<Byte> bytes = {1, 2, 3, 4, 5};
    ByteSpan span(bytes);

    EXPECT_EQ(span.size(), 5);
    EXPECT_EQ(span.data(), bytes.data());
    EXPECT_EQ(span[4], 5);
}

TEST(SpanTest, Subspan) {
    std::vector<Byte> bytes = {1, 2, 3, 4, 5};
    ByteSpan span(bytes);

    ByteSpan middle = span.subspan(1, 3);
    ASSERT_EQ(middle.size(), 3);
    EXPECT_EQ(middle[0], 2);
    EXPECT_EQ(middle[2], 4);

    EXPECT_EQ(span.first(2).size(), 2);
    EXPECT_TRUE(ByteSpan().empty());
}

// ============================================================================
// PublicKey Tests
// ============================================================================

TEST(PublicKeyTest, DefaultIsNull) {
    PublicKey key;
    EXPECT_TRUE(key.IsNull());
    EXPECT_EQ(key.size(), 32);
    for (size_t i = 0; i < PublicKey::SIZE; ++i) {
        EXPECT_EQ(key[i], 0);
    }
}

TEST(PublicKeyTest, ConstructFromArray) {
    std::array<Byte, 32> data;
    for (size_t i = 0; i < 32; ++i) {
        data[i] = static_cast<Byte>(i + 1);
    }

    PublicKey key(data);
    EXPECT_FALSE(key.IsNull());
    for (size_t i = 0; i < 32; ++i) {
        EXPECT_EQ(key[i], i + 1);
    }
}

TEST(PublicKeyTest, ShortInputIsZeroPadded) {
    Byte raw[3] = {0xAA, 0xBB, 0xCC};
    PublicKey key(raw, sizeof(raw));

    EXPECT_EQ(key[0], 0xAA);
    EXPECT_EQ(key[2], 0xCC);
    EXPECT_EQ(key[3], 0x00);
    EXPECT_EQ(key[31], 0x00);
}

TEST(PublicKeyTest, SingleNonZeroByteIsNotNull) {
    std::array<Byte, 32> data{};
    data[31] = 1;
    EXPECT_FALSE(PublicKey(data).IsNull());
}

TEST(PublicKeyTest, EqualityAndOrdering) {
    std::array<Byte, 32> a{};
    std::array<Byte, 32> b{};
    b[31] = 0x01;

    PublicKey k1(a);
    PublicKey k2(b);

    EXPECT_EQ(k1, PublicKey());
    EXPECT_NE(k1, k2);
    EXPECT_LT(k1, k2);
    EXPECT_FALSE(k2 < k1);
}

TEST(PublicKeyTest, NullKeyBase58IsAllOnes) {
    EXPECT_EQ(PublicKey().ToBase58(), std::string(32, '1'));
}

TEST(PublicKeyTest, Base58RoundTrip) {
    std::array<Byte, 32> data;
    for (size_t i = 0; i < 32; ++i) {
        data[i] = static_cast<Byte>(0xF0 - i * 3);
    }
    PublicKey key(data);

    auto parsed = PublicKey::FromBase58(key.ToBase58());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, key);
}

TEST(PublicKeyTest, ParsesKnownAddress) {
    // SPL token program
    auto key = PublicKey::FromBase58("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->ToHex(), "06ddf6e1d765a193d9cbe146ceeb79ac1cb485ed5f5b37913a8cf5857eff00a9");
    EXPECT_EQ(key->ToBase58(), "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA");
}

TEST(PublicKeyTest, FromBase58RejectsWrongLength) {
    EXPECT_FALSE(PublicKey::FromBase58("").has_value());
    EXPECT_FALSE(PublicKey::FromBase58("3EFU7m").has_value());
    EXPECT_FALSE(PublicKey::FromBase58(std::string(33, '1')).has_value());
}

TEST(PublicKeyTest, FromBase58RejectsInvalidCharacters) {
    // '0', 'O', 'I' and 'l' are not in the alphabet
    EXPECT_FALSE(PublicKey::FromBase58("0okenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA").has_value());
    EXPECT_FALSE(PublicKey::FromBase58("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5Dl").has_value());
}

TEST(PublicKeyTest, UsableAsMapAndHashKey) {
    std::array<Byte, 32> a{};
    a[0] = 1;
    std::array<Byte, 32> b{};
    b[0] = 2;

    std::map<PublicKey, int> ordered;
    ordered[PublicKey(b)] = 2;
    ordered[PublicKey(a)] = 1;
    EXPECT_EQ(ordered.begin()->second, 1);

    std::unordered_set<PublicKey> hashed;
    hashed.insert(PublicKey(a));
    hashed.insert(PublicKey(a));
    hashed.insert(PublicKey(b));
    EXPECT_EQ(hashed.size(), 2);
}

} // namespace test
} // namespace pythclient

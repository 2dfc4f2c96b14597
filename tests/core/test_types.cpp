// ATTESTOR - Core Types Tests
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include <gtest/gtest.h>
#include "attestor/core/hex.h"
#include "attestor/core/types.h"

#include <map>
#include <stdexcept>
#include <string>

namespace attestor {
namespace test {

// ============================================================================
// Amount Tests
// ============================================================================

TEST(AmountTest, MoneyRange) {
    EXPECT_TRUE(MoneyRange(0));
    EXPECT_TRUE(MoneyRange(COIN));
    EXPECT_TRUE(MoneyRange(MAX_MONEY));
    EXPECT_FALSE(MoneyRange(-1));
    EXPECT_FALSE(MoneyRange(MAX_MONEY + 1));
}

TEST(AmountTest, TimeConstants) {
    EXPECT_EQ(ONE_HOUR, 3600);
    EXPECT_EQ(ONE_DAY, 86400);
}

// ============================================================================
// Hash Tests
// ============================================================================

TEST(HashTest, DefaultIsNull) {
    Hash256 h;
    EXPECT_TRUE(h.IsNull());
    EXPECT_EQ(h.size(), 32u);

    Hash160 a;
    EXPECT_TRUE(a.IsNull());
    EXPECT_EQ(a.size(), 20u);
}

TEST(HashTest, ConstructFromBytes) {
    Byte raw[4] = {0xde, 0xad, 0xbe, 0xef};
    Hash160 h(raw, sizeof(raw));
    EXPECT_FALSE(h.IsNull());
    EXPECT_EQ(h[0], 0xde);
    EXPECT_EQ(h[3], 0xef);
    // Short input is zero padded
    EXPECT_EQ(h[4], 0x00);
    EXPECT_EQ(h[19], 0x00);

    h.SetNull();
    EXPECT_TRUE(h.IsNull());
}

TEST(HashTest, HexRoundTrip) {
    const std::string hex = "00112233445566778899aabbccddeeff00112233";
    Hash160 h = Hash160::FromHex(hex);
    EXPECT_EQ(h[0], 0x00);
    EXPECT_EQ(h[1], 0x11);
    EXPECT_EQ(h[15], 0xff);
    EXPECT_EQ(h.ToHex(), hex);
}

TEST(HashTest, FromHexRejectsMalformed) {
    EXPECT_THROW(Hash160::FromHex("0011"), std::invalid_argument);
    EXPECT_THROW(Hash160::FromHex(std::string(40, 'z')), std::invalid_argument);
    EXPECT_THROW(Hash256::FromHex(std::string(63, '0')), std::invalid_argument);
}

TEST(HashTest, Comparison) {
    Byte one = 1;
    Byte two = 2;
    Hash256 a(&one, 1);
    Hash256 b(&two, 1);
    Hash256 a2(&one, 1);

    EXPECT_EQ(a, a2);
    EXPECT_NE(a, b);
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);

    std::map<Hash256, int> m;
    m[b] = 2;
    m[a] = 1;
    EXPECT_EQ(m.begin()->second, 1);
}

// ============================================================================
// Hex Tests
// ============================================================================

TEST(HexTest, BytesToHex) {
    std::vector<uint8_t> data = {0x00, 0x0f, 0xa0, 0xff};
    EXPECT_EQ(BytesToHex(data), "000fa0ff");
    EXPECT_EQ(BytesToHex(std::vector<uint8_t>()), "");
}

TEST(HexTest, HexToBytes) {
    auto bytes = HexToBytes("000FA0ff");
    ASSERT_TRUE(bytes.has_value());
    ASSERT_EQ(bytes->size(), 4u);
    EXPECT_EQ((*bytes)[1], 0x0f);
    EXPECT_EQ((*bytes)[2], 0xa0);
    EXPECT_EQ((*bytes)[3], 0xff);
}

TEST(HexTest, HexToBytesRejectsInvalid) {
    EXPECT_FALSE(HexToBytes("abc").has_value());
    EXPECT_FALSE(HexToBytes("zz").has_value());
    EXPECT_TRUE(HexToBytes("").has_value());
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("deadBEEF"));
    EXPECT_FALSE(IsValidHex("dead_eef"));
    EXPECT_FALSE(IsValidHex("a"));
}

} // namespace test
} // namespace attestor

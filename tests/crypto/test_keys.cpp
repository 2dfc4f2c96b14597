// ATTESTOR - Key Tests
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include <gtest/gtest.h>
#include "attestor/crypto/keys.h"
#include "attestor/crypto/sha256.h"
#include "attestor/core/hex.h"

#include <algorithm>
#include <array>
#include <string>
#include <vector>

namespace attestor {
namespace test {

namespace {

// secp256k1 group order, big-endian
const std::array<uint8_t, 32> CURVE_ORDER = {
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
    0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41};

PrivateKey KeyFromByte(uint8_t seed) {
    std::array<uint8_t, 32> raw{};
    for (size_t i = 0; i < raw.size(); ++i) {
        raw[i] = static_cast<uint8_t>(seed + i);
    }
    return PrivateKey(raw);
}

PrivateKey KeyOne() {
    std::array<uint8_t, 32> raw{};
    raw[31] = 1;
    return PrivateKey(raw);
}

// Split a DER signature into big-endian r and s (leading zero stripped)
void SplitDer(const std::vector<uint8_t>& der, std::vector<uint8_t>& r, std::vector<uint8_t>& s) {
    size_t pos = 2;
    size_t rlen = der[pos + 1];
    r.assign(der.begin() + pos + 2, der.begin() + pos + 2 + rlen);
    pos += 2 + rlen;
    size_t slen = der[pos + 1];
    s.assign(der.begin() + pos + 2, der.begin() + pos + 2 + slen);
    while (r.size() > 1 && r[0] == 0) r.erase(r.begin());
    while (s.size() > 1 && s[0] == 0) s.erase(s.begin());
}

std::vector<uint8_t> DerInteger(std::vector<uint8_t> v) {
    if (v[0] & 0x80) {
        v.insert(v.begin(), 0x00);
    }
    std::vector<uint8_t> out = {0x02, static_cast<uint8_t>(v.size())};
    out.insert(out.end(), v.begin(), v.end());
    return out;
}

std::vector<uint8_t> JoinDer(const std::vector<uint8_t>& r, const std::vector<uint8_t>& s) {
    std::vector<uint8_t> body = DerInteger(r);
    std::vector<uint8_t> sEnc = DerInteger(s);
    body.insert(body.end(), sEnc.begin(), sEnc.end());
    std::vector<uint8_t> out = {0x30, static_cast<uint8_t>(body.size())};
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

// n - s for a big-endian s of at most 32 bytes
std::vector<uint8_t> NegateModOrder(const std::vector<uint8_t>& s) {
    std::array<uint8_t, 32> padded{};
    std::copy(s.begin(), s.end(), padded.begin() + (32 - s.size()));
    std::vector<uint8_t> out(32);
    int borrow = 0;
    for (int i = 31; i >= 0; --i) {
        int diff = CURVE_ORDER[i] - padded[i] - borrow;
        borrow = diff < 0 ? 1 : 0;
        out[i] = static_cast<uint8_t>(diff + (borrow ? 256 : 0));
    }
    while (out.size() > 1 && out[0] == 0) out.erase(out.begin());
    return out;
}

} // namespace

// ============================================================================
// Hash160
// ============================================================================

TEST(Hash160Test, EmptyInput) {
    EXPECT_EQ(ComputeHash160(std::vector<uint8_t>()).ToHex(),
              "b472a266d0bd89c13706a4132ccfb16f7c3b9fcb");
}

// ============================================================================
// PrivateKey
// ============================================================================

TEST(PrivateKeyTest, RangeChecks) {
    std::array<uint8_t, 32> zero{};
    EXPECT_FALSE(PrivateKey(zero).IsValid());
    EXPECT_FALSE(PrivateKey(CURVE_ORDER).IsValid());
    EXPECT_TRUE(KeyOne().IsValid());
    EXPECT_FALSE(PrivateKey().IsValid());
}

TEST(PrivateKeyTest, GenerateProducesDistinctValidKeys) {
    PrivateKey a = PrivateKey::Generate();
    PrivateKey b = PrivateKey::Generate();
    EXPECT_TRUE(a.IsValid());
    EXPECT_TRUE(b.IsValid());
    EXPECT_NE(a.GetPublicKey(), b.GetPublicKey());
}

TEST(PrivateKeyTest, GeneratorPoint) {
    PublicKey pub = KeyOne().GetPublicKey();
    EXPECT_TRUE(pub.IsValid());
    EXPECT_TRUE(pub.IsCompressed());
    EXPECT_EQ(pub.ToHex(),
              "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
    EXPECT_EQ(pub.GetHash160().ToHex(), "751e76e8199196d454941c45d1b3a323f1433bd6");
}

TEST(PrivateKeyTest, CopyKeepsKey) {
    PrivateKey a = KeyFromByte(7);
    PrivateKey b(a);
    PrivateKey c;
    c = a;
    EXPECT_EQ(b.GetPublicKey(), a.GetPublicKey());
    EXPECT_EQ(c.GetPublicKey(), a.GetPublicKey());
}

// ============================================================================
// Signatures
// ============================================================================

TEST(SignatureTest, SignAndVerify) {
    PrivateKey key = KeyFromByte(1);
    PublicKey pub = key.GetPublicKey();
    Hash256 msg = SHA256Hash(std::string("field work"));

    std::vector<uint8_t> sig = key.Sign(msg);
    ASSERT_FALSE(sig.empty());
    EXPECT_TRUE(pub.Verify(msg, sig));

    EXPECT_FALSE(pub.Verify(SHA256Hash(std::string("other work")), sig));
    EXPECT_FALSE(KeyFromByte(2).GetPublicKey().Verify(msg, sig));
}

TEST(SignatureTest, SignaturesAreLowS) {
    PrivateKey key = KeyFromByte(3);
    for (int i = 0; i < 16; ++i) {
        std::vector<uint8_t> sig = key.Sign(SHA256Hash(std::to_string(i)));
        std::vector<uint8_t> r, s;
        SplitDer(sig, r, s);
        // s <= n/2 means the top bit of a 32-byte s is clear
        EXPECT_TRUE(s.size() < 32 || (s[0] & 0x80) == 0) << "iteration " << i;
    }
}

TEST(SignatureTest, RejectsHighS) {
    PrivateKey key = KeyFromByte(4);
    PublicKey pub = key.GetPublicKey();
    Hash256 msg = SHA256Hash(std::string("malleable"));

    std::vector<uint8_t> sig = key.Sign(msg);
    std::vector<uint8_t> r, s;
    SplitDer(sig, r, s);

    std::vector<uint8_t> highS = JoinDer(r, NegateModOrder(s));
    EXPECT_NE(highS, sig);
    EXPECT_FALSE(pub.Verify(msg, highS));
}

TEST(SignatureTest, RejectsNonStrictDer) {
    PrivateKey key = KeyFromByte(5);
    PublicKey pub = key.GetPublicKey();
    Hash256 msg = SHA256Hash(std::string("strict"));
    std::vector<uint8_t> sig = key.Sign(msg);

    std::vector<uint8_t> trailing = sig;
    trailing.push_back(0x00);
    EXPECT_FALSE(pub.Verify(msg, trailing));

    std::vector<uint8_t> truncated(sig.begin(), sig.end() - 1);
    EXPECT_FALSE(pub.Verify(msg, truncated));

    EXPECT_FALSE(pub.Verify(msg, std::vector<uint8_t>()));
}

// ============================================================================
// PublicKey
// ============================================================================

TEST(PublicKeyTest, FromHex) {
    auto pub = PublicKey::FromHex(
        "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
    ASSERT_TRUE(pub.has_value());
    EXPECT_EQ(*pub, KeyOne().GetPublicKey());

    EXPECT_FALSE(PublicKey::FromHex("02").has_value());
    // Unknown prefix byte
    EXPECT_FALSE(PublicKey::FromHex("05" + std::string(64, '1')).has_value());
}

TEST(PublicKeyTest, EmptyKeyIsInvalid) {
    PublicKey empty;
    EXPECT_FALSE(empty.IsValid());
    EXPECT_EQ(empty.size(), 0u);
    EXPECT_TRUE(empty.GetHash160().IsNull());
}

TEST(PublicKeyTest, SerializeRoundTrip) {
    PublicKey pub = KeyFromByte(9).GetPublicKey();
    DataStream ss;
    ss << pub;
    EXPECT_EQ(ss.size(), 1 + PublicKey::COMPRESSED_SIZE);

    PublicKey out;
    ss >> out;
    EXPECT_EQ(out, pub);
}

} // namespace test
} // namespace attestor

// ATTESTOR - secp256k1 Keys Implementation
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include "attestor/crypto/keys.h"
#include "attestor/core/hex.h"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <stdexcept>

namespace attestor {

namespace {

// ============================================================================
// OpenSSL handle ownership
// ============================================================================

struct ECKeyFree { void operator()(EC_KEY* p) const { EC_KEY_free(p); } };
struct ECPointFree { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };
struct BNFree { void operator()(BIGNUM* p) const { BN_free(p); } };
struct BNClearFree { void operator()(BIGNUM* p) const { BN_clear_free(p); } };
struct SigFree { void operator()(ECDSA_SIG* p) const { ECDSA_SIG_free(p); } };

using ECKeyPtr = std::unique_ptr<EC_KEY, ECKeyFree>;
using ECPointPtr = std::unique_ptr<EC_POINT, ECPointFree>;
using BNPtr = std::unique_ptr<BIGNUM, BNFree>;
using SecretBNPtr = std::unique_ptr<BIGNUM, BNClearFree>;
using SigPtr = std::unique_ptr<ECDSA_SIG, SigFree>;

ECKeyPtr NewCurveKey() {
    return ECKeyPtr(EC_KEY_new_by_curve_name(NID_secp256k1));
}

/// EC_KEY holding the public point encoded in data, or null
ECKeyPtr ParsePublicKey(const uint8_t* data, size_t len) {
    ECKeyPtr key = NewCurveKey();
    if (!key) {
        return nullptr;
    }
    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    ECPointPtr point(EC_POINT_new(group));
    if (!point || EC_POINT_oct2point(group, point.get(), data, len, nullptr) != 1) {
        return nullptr;
    }
    if (EC_KEY_set_public_key(key.get(), point.get()) != 1) {
        return nullptr;
    }
    return key;
}

/// n/2 for the secp256k1 group order
BNPtr HalfOrder(const EC_GROUP* group) {
    BNPtr half(BN_new());
    if (!half) {
        return nullptr;
    }
    const BIGNUM* order = EC_GROUP_get0_order(group);
    if (!order || BN_rshift1(half.get(), order) != 1) {
        return nullptr;
    }
    return half;
}

/// EC_KEY holding the private scalar and its public point
ECKeyPtr MakeSigningKey(const uint8_t* secret) {
    ECKeyPtr key = NewCurveKey();
    if (!key) {
        return nullptr;
    }
    SecretBNPtr priv(BN_bin2bn(secret, PrivateKey::SIZE, nullptr));
    if (!priv || EC_KEY_set_private_key(key.get(), priv.get()) != 1) {
        return nullptr;
    }
    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    ECPointPtr pub(EC_POINT_new(group));
    if (!pub ||
        EC_POINT_mul(group, pub.get(), priv.get(), nullptr, nullptr, nullptr) != 1 ||
        EC_KEY_set_public_key(key.get(), pub.get()) != 1) {
        return nullptr;
    }
    return key;
}

bool IsInCurveRange(const uint8_t* secret) {
    ECKeyPtr key = NewCurveKey();
    if (!key) {
        return false;
    }
    BNPtr k(BN_bin2bn(secret, PrivateKey::SIZE, nullptr));
    if (!k) {
        return false;
    }
    const BIGNUM* order = EC_GROUP_get0_order(EC_KEY_get0_group(key.get()));
    return !BN_is_zero(k.get()) && BN_cmp(k.get(), order) < 0;
}

} // namespace

// ============================================================================
// Hash160
// ============================================================================

Hash160 ComputeHash160(const uint8_t* data, size_t len) {
    unsigned char sha[EVP_MAX_MD_SIZE];
    unsigned int shaLen = 0;
    unsigned char ripemd[EVP_MAX_MD_SIZE];
    unsigned int ripemdLen = 0;

    if (EVP_Digest(data, len, sha, &shaLen, EVP_sha256(), nullptr) != 1 ||
        EVP_Digest(sha, shaLen, ripemd, &ripemdLen, EVP_ripemd160(), nullptr) != 1 ||
        ripemdLen != Hash160::SIZE) {
        throw std::runtime_error("Hash160 digest failed");
    }
    return Hash160(ripemd, ripemdLen);
}

// ============================================================================
// PublicKey
// ============================================================================

PublicKey::PublicKey(const uint8_t* data, size_t len) {
    data_.fill(0);
    if (data && (len == COMPRESSED_SIZE || len == MAX_SIZE)) {
        std::memcpy(data_.data(), data, len);
        size_ = static_cast<uint8_t>(len);
    }
}

bool PublicKey::IsValid() const {
    if (size_ != COMPRESSED_SIZE && size_ != MAX_SIZE) {
        return false;
    }
    return ParsePublicKey(data_.data(), size_) != nullptr;
}

Hash160 PublicKey::GetHash160() const {
    if (size_ == 0) {
        return Hash160();
    }
    return ComputeHash160(data_.data(), size_);
}

bool PublicKey::Verify(const Hash256& hash, const std::vector<uint8_t>& signature) const {
    if (signature.empty() || size_ == 0) {
        return false;
    }

    ECKeyPtr key = ParsePublicKey(data_.data(), size_);
    if (!key) {
        return false;
    }

    const unsigned char* p = signature.data();
    SigPtr sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(signature.size())));
    if (!sig || p != signature.data() + signature.size()) {
        return false;
    }

    // Strict DER: re-encoding must reproduce the input exactly
    unsigned char* der = nullptr;
    int derLen = i2d_ECDSA_SIG(sig.get(), &der);
    if (derLen <= 0) {
        return false;
    }
    bool canonical = static_cast<size_t>(derLen) == signature.size() &&
                     std::memcmp(der, signature.data(), signature.size()) == 0;
    OPENSSL_free(der);
    if (!canonical) {
        return false;
    }

    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), nullptr, &s);
    BNPtr half = HalfOrder(EC_KEY_get0_group(key.get()));
    if (!half || BN_cmp(s, half.get()) > 0) {
        return false;
    }

    return ECDSA_do_verify(hash.data(), static_cast<int>(Hash256::SIZE),
                           sig.get(), key.get()) == 1;
}

bool PublicKey::operator==(const PublicKey& other) const {
    return size_ == other.size_ &&
           std::memcmp(data_.data(), other.data_.data(), size_) == 0;
}

bool PublicKey::operator<(const PublicKey& other) const {
    return std::lexicographical_compare(begin(), end(), other.begin(), other.end());
}

std::string PublicKey::ToHex() const {
    return BytesToHex(data_.data(), size_);
}

std::optional<PublicKey> PublicKey::FromHex(const std::string& hex) {
    auto bytes = HexToBytes(hex);
    if (!bytes) {
        return std::nullopt;
    }
    PublicKey key(*bytes);
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

// ============================================================================
// PrivateKey
// ============================================================================

PrivateKey::PrivateKey(const uint8_t* data) {
    data_.fill(0);
    if (data) {
        std::memcpy(data_.data(), data, SIZE);
        valid_ = IsInCurveRange(data_.data());
    }
}

PrivateKey::~PrivateKey() {
    Clear();
}

PrivateKey::PrivateKey(const PrivateKey& other)
    : data_(other.data_), valid_(other.valid_) {}

PrivateKey& PrivateKey::operator=(const PrivateKey& other) {
    if (this != &other) {
        data_ = other.data_;
        valid_ = other.valid_;
    }
    return *this;
}

void PrivateKey::Clear() {
    OPENSSL_cleanse(data_.data(), SIZE);
    valid_ = false;
}

PrivateKey PrivateKey::Generate() {
    std::array<uint8_t, SIZE> secret;
    for (int attempt = 0; attempt < 128; ++attempt) {
        if (RAND_bytes(secret.data(), static_cast<int>(SIZE)) != 1) {
            break;
        }
        PrivateKey key(secret);
        if (key.IsValid()) {
            OPENSSL_cleanse(secret.data(), SIZE);
            return key;
        }
    }
    OPENSSL_cleanse(secret.data(), SIZE);
    throw std::runtime_error("unable to generate private key");
}

PublicKey PrivateKey::GetPublicKey() const {
    if (!valid_) {
        return PublicKey();
    }
    ECKeyPtr key = MakeSigningKey(data_.data());
    if (!key) {
        return PublicKey();
    }

    uint8_t out[PublicKey::COMPRESSED_SIZE];
    size_t len = EC_POINT_point2oct(EC_KEY_get0_group(key.get()),
                                    EC_KEY_get0_public_key(key.get()),
                                    POINT_CONVERSION_COMPRESSED,
                                    out, sizeof(out), nullptr);
    if (len != PublicKey::COMPRESSED_SIZE) {
        return PublicKey();
    }
    return PublicKey(out, len);
}

std::vector<uint8_t> PrivateKey::Sign(const Hash256& hash) const {
    if (!valid_) {
        return {};
    }
    ECKeyPtr key = MakeSigningKey(data_.data());
    if (!key) {
        return {};
    }

    SigPtr sig(ECDSA_do_sign(hash.data(), static_cast<int>(Hash256::SIZE), key.get()));
    if (!sig) {
        return {};
    }

    // Normalize to low S: s' = n - s
    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);
    BNPtr half = HalfOrder(group);
    if (!half) {
        return {};
    }
    if (BN_cmp(s, half.get()) > 0) {
        BNPtr newR(BN_dup(r));
        BNPtr newS(BN_new());
        if (!newR || !newS ||
            BN_sub(newS.get(), EC_GROUP_get0_order(group), s) != 1 ||
            ECDSA_SIG_set0(sig.get(), newR.get(), newS.get()) != 1) {
            return {};
        }
        newR.release();
        newS.release();
    }

    int len = i2d_ECDSA_SIG(sig.get(), nullptr);
    if (len <= 0) {
        return {};
    }
    std::vector<uint8_t> der(static_cast<size_t>(len));
    unsigned char* p = der.data();
    if (i2d_ECDSA_SIG(sig.get(), &p) != len) {
        return {};
    }
    return der;
}

} // namespace attestor

// ATTESTOR - secp256k1 Keys
// Copyright (c) 2024 ATTESTOR Developers
// MIT License
//
// Worker signing keys. Signatures are DER-encoded ECDSA over secp256k1 and
// are only accepted in canonical form (strict DER, low S), so a valid
// signature has exactly one byte encoding.

#ifndef ATTESTOR_CRYPTO_KEYS_H
#define ATTESTOR_CRYPTO_KEYS_H

#include "attestor/core/serialize.h"
#include "attestor/core/types.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace attestor {

// ============================================================================
// Hash160 - RIPEMD160(SHA256(x))
// ============================================================================

Hash160 ComputeHash160(const uint8_t* data, size_t len);

inline Hash160 ComputeHash160(const std::vector<uint8_t>& data) {
    return ComputeHash160(data.data(), data.size());
}

// ============================================================================
// PublicKey
// ============================================================================

/**
 * A secp256k1 public key in SEC1 encoding, compressed (33 bytes) or
 * uncompressed (65 bytes).
 */
class PublicKey {
public:
    static constexpr size_t COMPRESSED_SIZE = 33;
    static constexpr size_t MAX_SIZE = 65;

    PublicKey() { data_.fill(0); }

    explicit PublicKey(const uint8_t* data, size_t len);

    explicit PublicKey(const std::vector<uint8_t>& data)
        : PublicKey(data.data(), data.size()) {}

    /// True if the bytes decode to a point on the curve
    bool IsValid() const;

    bool IsCompressed() const { return size_ == COMPRESSED_SIZE; }

    size_t size() const { return size_; }
    const uint8_t* data() const { return data_.data(); }
    const uint8_t* begin() const { return data_.data(); }
    const uint8_t* end() const { return data_.data() + size_; }

    std::vector<uint8_t> ToVector() const {
        return std::vector<uint8_t>(begin(), end());
    }

    /// Address of this key; null for an empty key
    Hash160 GetHash160() const;

    /**
     * Verify a DER signature over a 32-byte digest.
     * Rejects non-canonical DER and high-S signatures.
     */
    bool Verify(const Hash256& hash, const std::vector<uint8_t>& signature) const;

    bool operator==(const PublicKey& other) const;
    bool operator!=(const PublicKey& other) const { return !(*this == other); }
    bool operator<(const PublicKey& other) const;

    std::string ToHex() const;
    static std::optional<PublicKey> FromHex(const std::string& hex);

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::attestor::Serialize(s, static_cast<uint8_t>(size_));
        s.Write(data_.data(), size_);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t len = 0;
        ::attestor::Unserialize(s, len);
        if (len > MAX_SIZE) {
            throw std::ios_base::failure("PublicKey too large");
        }
        data_.fill(0);
        s.Read(data_.data(), len);
        size_ = len;
    }

private:
    std::array<uint8_t, MAX_SIZE> data_;
    uint8_t size_{0};
};

// ============================================================================
// PrivateKey
// ============================================================================

/**
 * A secp256k1 private key: exactly 32 bytes in the range [1, n-1].
 * Key material is wiped on destruction.
 */
class PrivateKey {
public:
    static constexpr size_t SIZE = 32;

    PrivateKey() { data_.fill(0); }

    /// Construct from raw 32 bytes; IsValid() reports range errors
    explicit PrivateKey(const uint8_t* data);

    explicit PrivateKey(const std::array<uint8_t, SIZE>& data)
        : PrivateKey(data.data()) {}

    ~PrivateKey();

    PrivateKey(const PrivateKey& other);
    PrivateKey& operator=(const PrivateKey& other);

    /// Generate a new random key from the OpenSSL CSPRNG
    static PrivateKey Generate();

    bool IsValid() const { return valid_; }

    const uint8_t* data() const { return data_.data(); }

    /// Derive the compressed public key
    PublicKey GetPublicKey() const;

    /// Sign a 32-byte digest; returns a canonical low-S DER signature
    /// (empty on failure)
    std::vector<uint8_t> Sign(const Hash256& hash) const;

private:
    std::array<uint8_t, SIZE> data_;
    bool valid_{false};

    void Clear();
};

} // namespace attestor

#endif // ATTESTOR_CRYPTO_KEYS_H

// ATTESTOR - SHA256 Hash Function
// Copyright (c) 2024 ATTESTOR Developers
// MIT License
//
// Incremental SHA-256 backed by OpenSSL's EVP digest interface.

#ifndef ATTESTOR_CRYPTO_SHA256_H
#define ATTESTOR_CRYPTO_SHA256_H

#include "attestor/core/serialize.h"
#include "attestor/core/types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace attestor {

/// SHA-256 hasher with incremental Write/Finalize
class SHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    SHA256& Write(const Byte* data, size_t len);

    SHA256& Write(const std::vector<Byte>& data) {
        return Write(data.data(), data.size());
    }

    /// Write the digest to hash; the hasher must be Reset before reuse
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Finalize into a Hash256
    Hash256 Finalize();

    SHA256& Reset();

private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const;
    };
    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

/// SHA256 of an object's canonical serialization
template<typename T>
Hash256 SerializeHash(const T& obj) {
    DataStream ss;
    ss << obj;
    return SHA256Hash(ss.Data());
}

} // namespace attestor

#endif // ATTESTOR_CRYPTO_SHA256_H

// ATTESTOR - SHA256 Implementation
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include "attestor/crypto/sha256.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace attestor {

void SHA256::CtxDeleter::operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
}

SHA256::SHA256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    Reset();
}

SHA256::~SHA256() = default;

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), hash, &len) != 1 || len != OUTPUT_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
}

Hash256 SHA256::Finalize() {
    Hash256 result;
    Finalize(result.data());
    return result;
}

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return *this;
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    return SHA256().Write(data, len).Finalize();
}

} // namespace attestor

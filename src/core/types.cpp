// ATTESTOR - Core Types Implementation
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include "attestor/core/types.h"
#include "attestor/core/hex.h"

namespace attestor {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }

    auto bytes = HexToBytes(hex);
    if (!bytes) {
        throw std::invalid_argument("Invalid hex character");
    }
    return BaseHash(bytes->data(), bytes->size());
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

} // namespace attestor

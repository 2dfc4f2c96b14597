// ATTESTOR - Serialization Implementation
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include "attestor/core/serialize.h"
#include "attestor/core/hex.h"

namespace attestor {

std::string DataStream::ToHex() const {
    return BytesToHex(data(), size());
}

} // namespace attestor

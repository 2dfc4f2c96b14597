// ATTESTOR - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#ifndef ATTESTOR_CORE_HEX_H
#define ATTESTOR_CORE_HEX_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace attestor {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

template<size_t N>
std::string BytesToHex(const std::array<uint8_t, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes (nullopt on odd length or non-hex characters)
std::optional<std::vector<uint8_t>> HexToBytes(const std::string& hex);

/// Check if string is valid, even-length hex
bool IsValidHex(const std::string& str);

} // namespace attestor

#endif // ATTESTOR_CORE_HEX_H

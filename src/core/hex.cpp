// ATTESTOR - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include "attestor/core/hex.h"

namespace attestor {

namespace {

int HexDigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string BytesToHex(const uint8_t* data, size_t len) {
    static const char hexChars[] = "0123456789abcdef";

    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hexChars[data[i] >> 4]);
        result.push_back(hexChars[data[i] & 0x0F]);
    }
    return result;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> HexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> result;
    result.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int high = HexDigitValue(hex[i]);
        int low = HexDigitValue(hex[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        result.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return result;
}

bool IsValidHex(const std::string& str) {
    if (str.size() % 2 != 0) {
        return false;
    }
    for (char c : str) {
        if (HexDigitValue(c) < 0) {
            return false;
        }
    }
    return true;
}

} // namespace attestor

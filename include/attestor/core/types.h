// ATTESTOR - Core Types Header
// Copyright (c) 2024 ATTESTOR Developers
// MIT License
//
// Fundamental value and identifier types shared by every protocol component.

#ifndef ATTESTOR_CORE_TYPES_H
#define ATTESTOR_CORE_TYPES_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace attestor {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token amount in smallest units
using Amount = int64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Duration in seconds
using Seconds = int64_t;

/// One whole token in base units
constexpr Amount COIN = 100000000LL;

/// Upper bound on any single balance or amount the protocol handles
constexpr Amount MAX_MONEY = 21000000000LL * COIN;

/// Check if amount is in valid range
inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_MONEY;
}

/// Time constants (seconds)
constexpr Seconds ONE_HOUR = 60 * 60;
constexpr Seconds ONE_DAY = 24 * ONE_HOUR;

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-width opaque identifier
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero-padded)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return std::memcmp(data_.data(), other.data_.data(), SIZE) < 0;
    }

    /// Lowercase hex, storage byte order
    std::string ToHex() const;

    /// Parse from hex; throws std::invalid_argument on malformed input
    static BaseHash FromHex(const std::string& hex);

    template<typename Stream>
    void Serialize(Stream& s) const {
        s.Write(data_.data(), SIZE);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        s.Read(data_.data(), SIZE);
    }

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 160-bit hash (20 bytes) - account addresses
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& base) : BaseHash<160>(base) {}

    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

// ============================================================================
// Protocol Identifiers
// ============================================================================

/// Ledger account address
using Address = Hash160;

/// Validator identity (address of the validator's key)
using ValidatorId = Hash160;

/// Worker identity (address of the worker's signing key)
using WorkerId = Hash160;

/// Building identifier assigned by the identity registry
using BuildingId = Hash256;

/// Key of a contribution record: SHA256(buildingId, workerId, amount)
using ContributionKey = Hash256;

} // namespace attestor

#endif // ATTESTOR_CORE_TYPES_H

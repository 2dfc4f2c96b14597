// ATTESTOR - Serialization Header
// Copyright (c) 2024 ATTESTOR Developers
// MIT License
//
// Little-endian binary serialization used for signing digests and for the
// persisted protocol tables. Objects opt in by providing member templates
// Serialize(Stream&) const and Unserialize(Stream&).

#ifndef ATTESTOR_CORE_SERIALIZE_H
#define ATTESTOR_CORE_SERIALIZE_H

#include "attestor/core/types.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace attestor {

/// Maximum size for serialized containers to prevent memory exhaustion
static constexpr uint64_t MAX_SERIALIZED_SIZE = 0x02000000;  // 32 MB

// ============================================================================
// Endianness Helpers (Always Little-Endian for serialization)
// ============================================================================

namespace detail {

inline uint16_t htole16(uint16_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap16(host);
#else
    return host;
#endif
}

inline uint32_t htole32(uint32_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap32(host);
#else
    return host;
#endif
}

inline uint64_t htole64(uint64_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap64(host);
#else
    return host;
#endif
}

} // namespace detail

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    DataStream() = default;
    explicit DataStream(const std::vector<uint8_t>& data) : data_(data) {}
    DataStream(const uint8_t* data, size_t len) : data_(data, data + len) {}

    /// Unread bytes remaining
    size_t size() const noexcept { return data_.size() - readPos_; }
    bool empty() const noexcept { return size() == 0; }

    /// Pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + readPos_; }

    /// Whole buffer, including bytes already read
    const std::vector<uint8_t>& Data() const noexcept { return data_; }

    void Write(const uint8_t* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_t len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }

    void Read(uint8_t* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + readPos_, len);
        readPos_ += len;
    }

    void Read(char* dst, size_t len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }

    std::string ToHex() const;

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<uint8_t> data_;
    size_t readPos_{0};
};

// ============================================================================
// Low-Level Serialization Functions
// ============================================================================

template<typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj) {
    s.Write(&obj, 1);
}

template<typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj) {
    obj = detail::htole32(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    obj = detail::htole64(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t obj;
    s.Read(&obj, 1);
    return obj;
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    uint32_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 4);
    return detail::htole32(obj);
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint64_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 8);
    return detail::htole64(obj);
}

// ============================================================================
// CompactSize Encoding
// ============================================================================

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        ser_writedata8(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        ser_writedata8(s, 0xFE);
        ser_writedata32(s, static_cast<uint32_t>(size));
    } else {
        ser_writedata8(s, 0xFF);
        ser_writedata64(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ser_readdata8(s);
    uint64_t size = 0;
    if (marker < 253) {
        size = marker;
    } else if (marker == 0xFE) {
        size = ser_readdata32(s);
        if (size < 253) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else if (marker == 0xFF) {
        size = ser_readdata64(s);
        if (size <= 0xFFFFFFFF) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else {
        throw std::ios_base::failure("invalid ReadCompactSize() marker");
    }
    if (size > MAX_SERIALIZED_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }
    return size;
}

// ============================================================================
// Fundamental Types
// ============================================================================

template<typename Stream> inline void Serialize(Stream& s, uint8_t v) { ser_writedata8(s, v); }
template<typename Stream> inline void Serialize(Stream& s, bool v) { ser_writedata8(s, v ? 1 : 0); }
template<typename Stream> inline void Serialize(Stream& s, uint32_t v) { ser_writedata32(s, v); }
template<typename Stream> inline void Serialize(Stream& s, int32_t v) { ser_writedata32(s, static_cast<uint32_t>(v)); }
template<typename Stream> inline void Serialize(Stream& s, uint64_t v) { ser_writedata64(s, v); }
template<typename Stream> inline void Serialize(Stream& s, int64_t v) { ser_writedata64(s, static_cast<uint64_t>(v)); }

template<typename Stream> inline void Unserialize(Stream& s, uint8_t& v) { v = ser_readdata8(s); }
template<typename Stream> inline void Unserialize(Stream& s, uint32_t& v) { v = ser_readdata32(s); }
template<typename Stream> inline void Unserialize(Stream& s, int32_t& v) { v = static_cast<int32_t>(ser_readdata32(s)); }
template<typename Stream> inline void Unserialize(Stream& s, uint64_t& v) { v = ser_readdata64(s); }
template<typename Stream> inline void Unserialize(Stream& s, int64_t& v) { v = static_cast<int64_t>(ser_readdata64(s)); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& v) {
    uint8_t b = ser_readdata8(s);
    if (b > 1) {
        throw std::ios_base::failure("invalid boolean encoding");
    }
    v = (b == 1);
}

// ============================================================================
// Containers (declared before definition so nested containers resolve)
// ============================================================================

template<typename Stream> void Serialize(Stream& s, const std::string& str);
template<typename Stream> void Unserialize(Stream& s, std::string& str);

template<typename Stream, typename T, typename A> void Serialize(Stream& s, const std::vector<T, A>& v);
template<typename Stream, typename T, typename A> void Unserialize(Stream& s, std::vector<T, A>& v);

template<typename Stream, typename K, typename C, typename A> void Serialize(Stream& s, const std::set<K, C, A>& set);
template<typename Stream, typename K, typename C, typename A> void Unserialize(Stream& s, std::set<K, C, A>& set);

template<typename Stream, typename K, typename V, typename C, typename A> void Serialize(Stream& s, const std::map<K, V, C, A>& m);
template<typename Stream, typename K, typename V, typename C, typename A> void Unserialize(Stream& s, std::map<K, V, C, A>& m);

// ============================================================================
// Serializable Objects
// ============================================================================

template<typename Stream, typename T>
inline void Serialize(Stream& s, const T& obj) {
    obj.Serialize(s);
}

template<typename Stream, typename T>
inline void Unserialize(Stream& s, T& obj) {
    obj.Unserialize(s);
}

// ============================================================================
// Container Definitions
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    if (!str.empty()) {
        s.Write(str.data(), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
    }
}

template<typename Stream, typename T, typename A>
void Serialize(Stream& s, const std::vector<T, A>& v) {
    WriteCompactSize(s, v.size());
    for (const auto& item : v) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T, typename A>
void Unserialize(Stream& s, std::vector<T, A>& v) {
    uint64_t size = ReadCompactSize(s);
    v.clear();
    v.reserve(size);
    for (uint64_t i = 0; i < size; ++i) {
        T item;
        Unserialize(s, item);
        v.push_back(std::move(item));
    }
}

template<typename Stream, typename K, typename C, typename A>
void Serialize(Stream& s, const std::set<K, C, A>& set) {
    WriteCompactSize(s, set.size());
    for (const auto& item : set) {
        Serialize(s, item);
    }
}

template<typename Stream, typename K, typename C, typename A>
void Unserialize(Stream& s, std::set<K, C, A>& set) {
    uint64_t size = ReadCompactSize(s);
    set.clear();
    for (uint64_t i = 0; i < size; ++i) {
        K item;
        Unserialize(s, item);
        set.insert(std::move(item));
    }
}

template<typename Stream, typename K, typename V, typename C, typename A>
void Serialize(Stream& s, const std::map<K, V, C, A>& m) {
    WriteCompactSize(s, m.size());
    for (const auto& entry : m) {
        Serialize(s, entry.first);
        Serialize(s, entry.second);
    }
}

template<typename Stream, typename K, typename V, typename C, typename A>
void Unserialize(Stream& s, std::map<K, V, C, A>& m) {
    uint64_t size = ReadCompactSize(s);
    m.clear();
    for (uint64_t i = 0; i < size; ++i) {
        K key;
        V value;
        Unserialize(s, key);
        Unserialize(s, value);
        m.emplace(std::move(key), std::move(value));
    }
}

// ============================================================================
// DataStream Operators
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace attestor

#endif // ATTESTOR_CORE_SERIALIZE_H

// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_UTIL_SERIALIZE_H
#define CONTINUITY_UTIL_SERIALIZE_H

#include <uint256.h>

#include <cstdint>
#include <cstring>
#include <vector>

/**
 * Fixed-width little-endian encoding helpers.
 *
 * Every consensus preimage in this project (entropy, VDF rounds, chunk draws,
 * commitment hash, aggregation leaves) is built with these, so the byte layout
 * is identical on every host regardless of native endianness.
 */

inline void WriteLE32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; i++)
        out.push_back(static_cast<uint8_t>(v >> (i * 8)));
}

inline void WriteLE32(uint8_t* out, uint32_t v) {
    for (int i = 0; i < 4; i++)
        out[i] = static_cast<uint8_t>(v >> (i * 8));
}

inline void WriteLE64(std::vector<uint8_t>& out, uint64_t v) {
    for (int i = 0; i < 8; i++)
        out.push_back(static_cast<uint8_t>(v >> (i * 8)));
}

inline void WriteLE64(uint8_t* out, uint64_t v) {
    for (int i = 0; i < 8; i++)
        out[i] = static_cast<uint8_t>(v >> (i * 8));
}

inline void WriteUint256(std::vector<uint8_t>& out, const uint256& v) {
    out.insert(out.end(), v.begin(), v.end());
}

inline uint64_t ReadLE64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; i++)
        v |= static_cast<uint64_t>(p[i]) << (i * 8);
    return v;
}

inline uint32_t ReadLE32(const uint8_t* p) {
    uint32_t v = 0;
    for (int i = 0; i < 4; i++)
        v |= static_cast<uint32_t>(p[i]) << (i * 8);
    return v;
}

/**
 * Bounds-checked reader over an untrusted byte buffer.
 * Every Read* returns false once the buffer is exhausted; the reader never
 * touches memory past the end.
 */
class CByteReader {
public:
    explicit CByteReader(const std::vector<uint8_t>& data)
        : m_data(data), m_pos(0) {}

    bool ReadU8(uint8_t& v) {
        if (Remaining() < 1) return false;
        v = m_data[m_pos++];
        return true;
    }

    bool ReadU32(uint32_t& v) {
        if (Remaining() < 4) return false;
        v = ReadLE32(m_data.data() + m_pos);
        m_pos += 4;
        return true;
    }

    bool ReadU64(uint64_t& v) {
        if (Remaining() < 8) return false;
        v = ReadLE64(m_data.data() + m_pos);
        m_pos += 8;
        return true;
    }

    bool ReadHash(uint256& v) {
        if (Remaining() < 32) return false;
        memcpy(v.data, m_data.data() + m_pos, 32);
        m_pos += 32;
        return true;
    }

    size_t Remaining() const { return m_data.size() - m_pos; }
    size_t Position() const { return m_pos; }
    bool AtEnd() const { return m_pos == m_data.size(); }

private:
    const std::vector<uint8_t>& m_data;
    size_t m_pos;
};

#endif // CONTINUITY_UTIL_SERIALIZE_H

// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_UINT256_H
#define CONTINUITY_UINT256_H

#include <cstring>
#include <cstdint>
#include <string>
#include <iosfwd>

/**
 * 256-bit opaque value (hashes, keys, entropy).
 *
 * Bytes are kept in the order they enter hash preimages. GetHex() prints them
 * in that same order, so a hex string round-trips through SetHex() unchanged.
 */
class uint256 {
public:
    static constexpr size_t WIDTH = 32;

    uint8_t data[WIDTH];

    uint256() { memset(data, 0, WIDTH); }

    explicit uint256(const uint8_t* bytes) { memcpy(data, bytes, WIDTH); }

    bool IsNull() const {
        for (size_t i = 0; i < WIDTH; i++)
            if (data[i] != 0) return false;
        return true;
    }

    void SetNull() { memset(data, 0, WIDTH); }

    // Lexicographic byte order. Used for STL containers and canonical sorting.
    bool operator<(const uint256& other) const {
        return memcmp(data, other.data, WIDTH) < 0;
    }

    bool operator==(const uint256& other) const {
        return memcmp(data, other.data, WIDTH) == 0;
    }

    bool operator!=(const uint256& other) const {
        return memcmp(data, other.data, WIDTH) != 0;
    }

    uint8_t* begin() { return data; }
    const uint8_t* begin() const { return data; }
    uint8_t* end() { return data + WIDTH; }
    const uint8_t* end() const { return data + WIDTH; }
    static constexpr size_t size() { return WIDTH; }

    /** First 8 bytes as a little-endian integer. */
    uint64_t GetUint64LE() const;

    std::string GetHex() const;

    /**
     * Parse a 64-character hex string.
     * @return false (and leaves the value null) if the string is malformed
     */
    bool SetHex(const std::string& str);

    static uint256 FromHex(const std::string& str);
};

// Stream output operator for Boost.Test
std::ostream& operator<<(std::ostream& os, const uint256& h);

#endif // CONTINUITY_UINT256_H

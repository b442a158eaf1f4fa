// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_TEST_FUZZ_UTIL_H
#define CONTINUITY_TEST_FUZZ_UTIL_H

#include <uint256.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

/**
 * FuzzedDataProvider - Consume fuzz input in structured ways
 *
 * Short reads yield zero (or a shorter vector) instead of failing, so a
 * harness never has to check how much input is left.
 */
class FuzzedDataProvider {
private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_;

public:
    FuzzedDataProvider(const uint8_t* data, size_t size)
        : data_(data), size_(size), offset_(0) {}

    size_t remaining_bytes() const {
        return size_ > offset_ ? size_ - offset_ : 0;
    }

    uint8_t ConsumeUint8() {
        if (remaining_bytes() < 1) return 0;
        return data_[offset_++];
    }

    /**
     * Consume a little-endian integer of up to 8 bytes
     */
    uint64_t ConsumeUintN(size_t n) {
        uint64_t result = 0;
        for (size_t i = 0; i < n; i++) {
            result |= static_cast<uint64_t>(ConsumeUint8()) << (i * 8);
        }
        return result;
    }

    uint32_t ConsumeUint32() { return static_cast<uint32_t>(ConsumeUintN(4)); }
    uint64_t ConsumeUint64() { return ConsumeUintN(8); }

    bool ConsumeBool() {
        return ConsumeUint8() & 1;
    }

    /**
     * Value in [min, max]; consumes 8 bytes
     */
    uint64_t ConsumeUint64InRange(uint64_t min, uint64_t max) {
        if (min >= max) return min;
        const uint64_t range = max - min;
        const uint64_t v = ConsumeUint64();
        return range == UINT64_MAX ? v : min + v % (range + 1);
    }

    std::vector<uint8_t> ConsumeBytes(size_t max_length) {
        size_t length = std::min(max_length, remaining_bytes());
        std::vector<uint8_t> result(data_ + offset_, data_ + offset_ + length);
        offset_ += length;
        return result;
    }

    std::vector<uint8_t> ConsumeRemainingBytes() {
        return ConsumeBytes(remaining_bytes());
    }

    /**
     * String whose length is taken from the next byte
     */
    std::string ConsumeShortString() {
        auto bytes = ConsumeBytes(ConsumeUint8());
        return std::string(bytes.begin(), bytes.end());
    }

    /**
     * 32 bytes as a hash; zero-padded when input runs out
     */
    uint256 ConsumeHash() {
        uint256 result;
        auto bytes = ConsumeBytes(32);
        if (!bytes.empty()) {
            std::memcpy(result.data, bytes.data(), bytes.size());
        }
        return result;
    }
};

#endif // CONTINUITY_TEST_FUZZ_UTIL_H

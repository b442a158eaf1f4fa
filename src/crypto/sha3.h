// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_CRYPTO_SHA3_H
#define CONTINUITY_CRYPTO_SHA3_H

#include <uint256.h>

#include <stdint.h>
#include <stdlib.h>
#include <vector>

/**
 * SHA-3 (Keccak, NIST FIPS 202) hashing.
 *
 * Every consensus hash in the protocol (entropy combination, VDF rounds,
 * chunk draws, chunk/data hashes, commitment hash, aggregation roots) is
 * SHA3-256. The primitive comes from OpenSSL's EVP layer.
 */

/**
 * Compute SHA3-256 hash of data (one-shot function)
 *
 * @param data Input data to hash
 * @param len Length of input data in bytes
 * @param hash Output buffer for 32-byte hash
 */
void SHA3_256(const uint8_t* data, size_t len, uint8_t hash[32]);

/**
 * Compute SHA3-512 hash of data (one-shot function)
 *
 * @param data Input data to hash
 * @param len Length of input data in bytes
 * @param hash Output buffer for 64-byte hash
 */
void SHA3_512(const uint8_t* data, size_t len, uint8_t hash[64]);

/** SHA3-256 of a byte vector, as a uint256. */
inline uint256 SHA3_256(const std::vector<uint8_t>& data) {
    uint256 out;
    SHA3_256(data.data(), data.size(), out.data);
    return out;
}

/**
 * Streaming SHA3-256 for inputs too large to buffer (whole-file data hash).
 *
 * Not copyable. Finalize() may be called once; Reset() starts over.
 */
class CSHA3_256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    CSHA3_256();
    ~CSHA3_256();

    CSHA3_256(const CSHA3_256&) = delete;
    CSHA3_256& operator=(const CSHA3_256&) = delete;

    CSHA3_256& Write(const uint8_t* data, size_t len);
    CSHA3_256& Write(const std::vector<uint8_t>& data) { return Write(data.data(), data.size()); }
    CSHA3_256& Write(const uint256& v) { return Write(v.data, uint256::WIDTH); }

    void Finalize(uint8_t hash[OUTPUT_SIZE]);
    uint256 Finalize();

    CSHA3_256& Reset();

private:
    struct Impl;
    Impl* m_impl;
    bool m_finalized{false};
};

#endif // CONTINUITY_CRYPTO_SHA3_H

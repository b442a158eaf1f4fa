// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_ENTROPY_ENTROPY_H
#define CONTINUITY_ENTROPY_ENTROPY_H

#include <uint256.h>

#include <cstdint>
#include <optional>
#include <vector>

class CByteReader;

/**
 * Multi-source entropy for one proving epoch.
 *
 * combinedHash = SHA3-256( blockchainEntropy(32) || beaconOrZeros(32)
 *                          || localEntropy(32) || timestamp_le64 )
 *
 * An absent beacon contributes 32 zero bytes; the preimage layout never
 * changes. combinedHash is the only field consensus logic reads, and anyone
 * holding the other fields can recompute it byte for byte.
 */
struct MultiSourceEntropy {
    uint256 blockchainEntropy;              // Authoritative external source
    std::optional<uint256> beaconEntropy;   // Secondary external source
    uint256 localEntropy;                   // Prover-local OS randomness
    uint64_t timestamp{0};                  // Collection time, ms since epoch
    uint256 combinedHash;

    // blockchain(32) + beaconFlag(1) + beacon(32) + local(32) + timestamp(8) + combined(32)
    static constexpr size_t SERIALIZED_SIZE = 137;

    /** True if combinedHash recomputes from the three sources and timestamp. */
    bool IsConsistent() const;

    void SerializeTo(std::vector<uint8_t>& out) const;
    std::vector<uint8_t> Serialize() const;

    /** Read one entropy record; false on truncation or a non-canonical beacon encoding. */
    static bool Unserialize(CByteReader& reader, MultiSourceEntropy& out);
    static std::optional<MultiSourceEntropy> Deserialize(const std::vector<uint8_t>& data);

    bool operator==(const MultiSourceEntropy& other) const;
    bool operator!=(const MultiSourceEntropy& other) const { return !(*this == other); }
};

enum class EntropyError {
    NONE,
    MISSING_BLOCKCHAIN_SOURCE,  // Blockchain entropy empty (the only mandatory source)
    MALFORMED_SOURCE,           // A source is not exactly 32 bytes
    RNG_FAILURE                 // OS randomness unavailable
};

const char* EntropyErrorToString(EntropyError error);

/** Hash the sources in the fixed consensus layout. */
uint256 ComputeCombinedHash(const uint256& blockchainEntropy,
                            const std::optional<uint256>& beaconEntropy,
                            const uint256& localEntropy,
                            uint64_t timestamp);

inline uint256 ComputeCombinedHash(const MultiSourceEntropy& e) {
    return ComputeCombinedHash(e.blockchainEntropy, e.beaconEntropy, e.localEntropy, e.timestamp);
}

/**
 * Combine external sources with fresh local randomness.
 *
 * Local entropy comes from the OS CSPRNG and is never replayable; the
 * timestamp is the current wall clock.
 *
 * @param blockchainEntropy  Mandatory 32-byte source
 * @param beaconEntropy      Optional 32-byte source
 * @param out                Combined entropy on success
 * @param error              Failure reason
 * @return true on success
 */
bool CombineEntropy(const std::vector<uint8_t>& blockchainEntropy,
                    const std::optional<std::vector<uint8_t>>& beaconEntropy,
                    MultiSourceEntropy& out,
                    EntropyError& error);

/**
 * Deterministic variant with caller-supplied local entropy and timestamp
 * (replay of a recorded epoch).
 */
MultiSourceEntropy CombineEntropyWithLocal(const uint256& blockchainEntropy,
                                           const std::optional<uint256>& beaconEntropy,
                                           const uint256& localEntropy,
                                           uint64_t timestamp);

/**
 * VDF input state for a prover in this epoch.
 *
 * input = SHA3-256( combinedHash || proverKey )
 */
uint256 DeriveVDFInput(const MultiSourceEntropy& entropy, const uint256& proverKey);

#endif // CONTINUITY_ENTROPY_ENTROPY_H
